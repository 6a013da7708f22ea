// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/error/en.h"

#include <string>
#include <vector>
#include <fstream>
#include <type_traits>
#include "lib.hpp"
#include "log.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jdaloc = rapidjson::Document::AllocatorType;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into @p document. Logs and returns false on a parse error.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            logging::get()->error("JSON parse error: {} at offset {}",
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Parse a JSON file into @p document. Logs and returns false when unreadable or invalid.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            logging::get()->error("failed to open file: {}", file_path);
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            logging::get()->error("JSON parse error in {}: {} at offset {}", file_path,
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Utility to convert any Value to string
    inline std::string val2str(const rapidjson::Value& value) {
        if (value.IsString()) return value.GetString();
        if (value.IsBool()) return value.GetBool() ? "true" : "false";
        if (value.IsNull()) return "null";
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
        return buffer.GetString();
    }

    // Returns the member @p key converted to T, or @p default_value when missing or of another type.
    template <typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber()) return val2str(val);
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>) {
            if (val.IsNumber()) return val.GetDouble();
        } else if constexpr (std::is_same_v<T, unsigned>) {
            if (val.IsUint()) return val.GetUint();
        }
        return default_value;
    }

    // String array member, empty when missing. Non-string elements are an error.
    inline StrList get_strings(const rapidjson::Value& parent, const std::string& key) {
        StrList out;
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return out;
        const jval& arr = parent.FindMember(key.c_str())->value;
        if (!arr.IsArray()) THROW("JSON member '%s' must be an array", key.c_str());
        for (const auto& item : arr.GetArray()) {
            if (!item.IsString()) THROW("JSON member '%s' must hold strings only", key.c_str());
            out.emplace_back(item.GetString());
        }
        return out;
    }

    // Template helper to set a value in a RapidJSON object.
    template <typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, jdaloc& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             rapidjson::Value(value.c_str(), allocator).Move(),
                             allocator);
        } else {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                             value,
                             allocator);
        }
    }

    // Same, on the document itself
    template <typename T>
    inline void set(rapidjson::Document& document, const std::string& key, const T& value) {
        set(static_cast<rapidjson::Value&>(document), key, value, document.GetAllocator());
    }

    inline void set_strings(rapidjson::Value& parent, const std::string& key, const StrList& values, jdaloc& allocator) {
        jval arr(rapidjson::kArrayType);
        for (const auto& v : values) arr.PushBack(jval(v.c_str(), allocator).Move(), allocator);
        parent.AddMember(jval(key.c_str(), allocator).Move(), arr, allocator);
    }

    inline std::string dump(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Writes @p value pretty-printed to @p file_path, replacing it.
    inline void write_file(const std::string& file_path, const rapidjson::Value& value) {
        std::ofstream ofs(file_path, std::ios::trunc);
        if (!ofs.is_open()) THROW("failed to open '%s' for writing", file_path.c_str());
        ofs << dump(value, true) << '\n';
        if (!ofs) THROW("failed to write '%s'", file_path.c_str());
    }

} // namespace jhlp
