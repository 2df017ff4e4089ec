/*
 * This file is part of coinpool, a mining sub-pool host
 * Copyright (c) 2021-2024 SChernykh <https://github.com/SChernykh>
 * Copyright (c) 2024 The coinpool developers
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, version 3.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace coinpool {

template<typename T, typename U>
struct parse_wrapper
{
	static constexpr bool parse(T&, const char*, U&)
	{
		static_assert(not_implemented<T>::value, "JSON parser for this type is not implemented");
		return false;
	}
};

template<typename T, typename U>
FORCEINLINE bool parseValue(T& v, const char* name, U& out_value) { return parse_wrapper<T, U>::parse(v, name, out_value); }

#define JSON_VALUE_PARSER(type, out_type) \
template<typename T> \
struct parse_wrapper<T, out_type> \
{ \
	static FORCEINLINE bool parse(T& v, const char* name, out_type& out_value) \
	{ \
		if (v.IsObject() && v.HasMember(name)) { \
			const auto& t = v[name]; \
			if (t.Is##type()) { \
				out_value = static_cast<out_type>(t.Get##type()); \
				return true; \
			} \
		} \
		return false; \
	} \
};


JSON_VALUE_PARSER(String, const char*)
JSON_VALUE_PARSER(String, std::string)
JSON_VALUE_PARSER(Uint, uint8_t)
JSON_VALUE_PARSER(Uint, uint32_t)
JSON_VALUE_PARSER(Int, int32_t)
JSON_VALUE_PARSER(Uint64, uint64_t)
JSON_VALUE_PARSER(Bool, bool)

#undef JSON_VALUE_PARSER

// Serializes any JSON value back to compact text, used for the opaque parts of pool and worker records
template<typename T>
NOINLINE std::string to_json_string(const T& v)
{
	rapidjson::StringBuffer buf;
	rapidjson::Writer<rapidjson::StringBuffer> writer(buf);
	v.Accept(writer);
	return std::string(buf.GetString(), buf.GetSize());
}

#define PARSE(doc, var, name) parseValue(doc, #name, var.name)

} // namespace coinpool
