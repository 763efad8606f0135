// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cstdint>
#include <fstream>
#include <string>
#include <type_traits>
#include "dbal/log.hpp"

namespace dbal {

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = json::Value::ConstMemberIterator;
using jalloc = json::Document::AllocatorType;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into a Document. Logs and returns false on error.
    inline bool parse_str(const std::string& json_string, jdoc& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            DBAL_LOG_ERROR("json", "parse error: %s at offset %zu",
                           json::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Parse a JSON file into a Document.
    inline bool parse_file(const std::string& file_path, jdoc& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            DBAL_LOG_ERROR("json", "failed to open file: %s", file_path.c_str());
            return false;
        }
        json::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            DBAL_LOG_ERROR("json", "parse error in file %s: %s at offset %zu", file_path.c_str(),
                           json::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    inline std::string stringify(const jval& value, bool pretty = false) {
        json::StringBuffer buffer;
        if (pretty) {
            json::PrettyWriter<json::StringBuffer> writer(buffer);
            value.Accept(writer);
        } else {
            json::Writer<json::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Typed member access with default, mirrors nlohmann's value(key, default).
    template<typename T>
    inline T get(const jval& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber()) return stringify(val);
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>) {
            if (val.IsNumber()) return val.GetDouble();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        }
        return default_value;
    }

    inline jval str(const std::string& s, jalloc& a) {
        return jval(s.c_str(), static_cast<json::SizeType>(s.size()), a);
    }

} // namespace jhlp

} // namespace dbal
