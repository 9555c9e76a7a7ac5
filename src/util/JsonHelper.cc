/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "JsonHelper.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>
#include <rapidjson/pointer.h>

namespace apx {
namespace json {

const rapidjson::Value& required(const rapidjson::Value& object, std::string_view field)
{
	auto val = optional(object, field);
	if (!val)
		BOOST_THROW_EXCEPTION(Error() << MissingField{std::string{field}});

	return *val;
}

const rapidjson::Value* optional(const rapidjson::Value& object, std::string_view field)
{
	return rapidjson::Pointer{field.data(), field.size()}.Get(object);
}

std::string_view string_view(const rapidjson::Value& value)
{
	if (!value.IsString())
		BOOST_THROW_EXCEPTION(NotString());

	return {value.GetString(), value.GetStringLength()};
}

std::string string(const rapidjson::Value& value)
{
	return std::string{string_view(value)};
}

}} // end of namespace
