/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <hiredis/hiredis.h>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

namespace apx {
namespace redis {

// Error enum
enum class Error
{
	ok = REDIS_OK,
	io = REDIS_ERR_IO,
	eof = REDIS_ERR_EOF,
	protocol = REDIS_ERR_PROTOCOL,
	oom = REDIS_ERR_OOM,
	other = REDIS_ERR_OTHER,

	// other logical errors
	command_error = 1000,
	field_not_found
};

std::error_code make_error_code(Error err);
const std::error_category& redis_error_category();

class Reply
{
public:
	explicit Reply(redisReply *r = nullptr) noexcept;

	using iterator = std::vector<Reply>::const_iterator;
	iterator begin() const;
	iterator end() const;

	bool is_string() const {return m_reply && m_reply->type == REDIS_REPLY_STRING;}
	bool is_nil() const {return !m_reply || m_reply->type == REDIS_REPLY_NIL;}
	bool is_error() const {return m_reply && m_reply->type == REDIS_REPLY_ERROR;}

	std::string_view as_string() const noexcept;
	std::string_view as_status() const noexcept;
	std::string_view as_error() const noexcept;
	std::string_view as_any_string() const noexcept;
	long as_int() const noexcept;

	explicit operator bool() const noexcept ;

	Reply as_array(std::size_t i) const noexcept;
	Reply as_array(std::size_t i, std::error_code& ec) const noexcept;
	Reply operator[](std::size_t i) const noexcept;
	std::size_t array_size() const noexcept;

	/// Return a tuple of the first \a count replies in the array.
	template <std::size_t count>
	auto as_tuple(std::error_code& ec) const
	{
		return as_tuple_impl(ec, std::make_index_sequence<count>{});
	}

private:
	template <std::size_t... index>
	auto as_tuple_impl(std::error_code& ec, std::index_sequence<index...>) const
	{
		return std::make_tuple(as_array(index, ec)...);
	}

private:
	std::shared_ptr<::redisReply> m_reply;

	std::vector<Reply> m_array;
};

class ReplyReader
{
public:
	enum class Result {ok, error, not_ready};

public:
	ReplyReader() = default;
	ReplyReader(ReplyReader&&) = default;
	ReplyReader(const ReplyReader&) = delete;
	~ReplyReader() = default;
	ReplyReader& operator=(ReplyReader&&) = default;
	ReplyReader& operator=(const ReplyReader&) = delete;

	void feed(const char *data, std::size_t size);
	std::tuple<Reply, Result> get();

private:
	struct Deleter {void operator()(::redisReader*) const noexcept; };
	std::unique_ptr<::redisReader, Deleter> m_reader{::redisReaderCreate()};
};

class CommandString
{
public:
	/// The first argument MUST be the command string. For security
	/// reason, this class does not accept std::string and const char*.
	/// It expects a hard-coded string literal. However in C++ we can't
	/// make it mandatory. We can only specify a const char array.
	template <std::size_t N, typename... Args>
	explicit CommandString(const char (&cmd)[N], Args... args) :
		m_length{::redisFormatCommand(&m_cmd, cmd, args...)}
	{
		if (m_length < 0)
			throw std::logic_error("invalid command string");
	}
	CommandString(CommandString&& other) noexcept ;
	CommandString(const CommandString&) = delete;
	~CommandString();
	CommandString& operator=(CommandString&& other) noexcept ;
	CommandString& operator=(const CommandString&) = delete;

	void swap(CommandString& other) noexcept ;

	std::size_t length() const {return static_cast<std::size_t>(m_length);}
	std::string_view str() const {return {m_cmd, length()};}

private:
	char    *m_cmd{};
	int     m_length{};
};

class PoolBase
{
public:
	virtual ~PoolBase() = default;
	virtual void dealloc(boost::asio::ip::tcp::socket socket) = 0;
};

class Connection : public std::enable_shared_from_this<Connection>
{
public:
	using Completion = std::function<void(Reply, std::error_code)>;

public:
	Connection(PoolBase& parent, boost::asio::ip::tcp::socket socket);

	Connection(Connection&&) = delete;
	Connection(const Connection&) = delete;
	~Connection();

	Connection& operator=(Connection&&) = delete;
	Connection& operator=(const Connection&) = delete;

	/// Send a command and call \a callback with the reply. Replies are
	/// delivered in the order the commands are sent.
	template <std::size_t N, typename... Args>
	void command(Completion&& callback, const char (&cmd)[N], Args... args)
	{
		try
		{
			do_write(CommandString{cmd, args...}, std::move(callback));
		}
		catch (std::logic_error&)
		{
			callback(Reply{}, make_error_code(Error::protocol));
		}
	}

	void disconnect();

private:
	void do_write(CommandString&& cmd, Completion&& completion);
	void do_read();
	void on_read(boost::system::error_code ec, std::size_t bytes);

private:
	boost::asio::ip::tcp::socket m_socket;
	boost::asio::strand<boost::asio::ip::tcp::socket::executor_type> m_strand;

	std::vector<char> m_read_buf;

	std::deque<Completion> m_callbacks;

	ReplyReader m_reader;
	PoolBase&   m_parent;
};

/// Keeps idle connections to the redis server so that every request does
/// not need to reconnect.
class Pool : public PoolBase
{
public:
	Pool(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& remote);

	std::shared_ptr<Connection> alloc();
	void dealloc(boost::asio::ip::tcp::socket socket) override;

private:
	boost::asio::ip::tcp::socket get_sock();

private:
	boost::asio::io_context&                    m_ioc;
	boost::asio::ip::tcp::endpoint              m_remote;
	std::vector<boost::asio::ip::tcp::socket>   m_socks;

	std::mutex  m_mx;
};

}} // end of namespace

namespace std
{
	template <> struct is_error_code_enum<apx::redis::Error> : true_type {};
}
