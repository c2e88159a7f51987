// ==============================================================================
// report.cpp - Загрузка и сериализация отчётов песочницы
// ==============================================================================

#include <curator/platform.hpp>
#include <curator/report.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>
#include <system_error>

namespace curator::io {

// ============================================================================
// ReportError
// ============================================================================

std::string ReportError::format() const {
    return "failed to load report '" + path + "' - " + message;
}

// ============================================================================
// Загрузка
// ============================================================================

ReportResult parse_report(std::string_view content, const std::filesystem::path& path) {
    ReportResult result;

    // Полная точность: иначе 17-значные дробные поля меняются при перезаписи
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(content.data(), content.size());

    if (doc.HasParseError()) {
        result.error = ReportError{ReportErrorKind::ParseError,
                                   std::string("JSON parse error: ") +
                                       rapidjson::GetParseError_En(doc.GetParseError()) +
                                       " at offset " + std::to_string(doc.GetErrorOffset()),
                                   platform::path_to_utf8(path)};
        return result;
    }

    result.report.path = path;
    result.report.data = Value::from_rapidjson(doc);
    result.report.size = static_cast<std::uint64_t>(content.size());
    result.ok = true;
    return result;
}

ReportResult load_report(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        ReportResult result;
        result.error = ReportError{ReportErrorKind::FileNotFound, "file not found",
                                   platform::path_to_utf8(path)};
        return result;
    }

    auto content = platform::read_file(path);
    if (!content.has_value()) {
        ReportResult result;
        result.error = ReportError{ReportErrorKind::IoError, "could not read file",
                                   platform::path_to_utf8(path)};
        return result;
    }

    return parse_report(*content, path);
}

// ============================================================================
// Сериализация
// ============================================================================

std::string serialize_report(const Value& data, bool pretty) {
    rapidjson::Document doc = data.to_rapidjson_document();
    rapidjson::StringBuffer buffer;

    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }

    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string serialize_json(const rapidjson::Value& value, unsigned indent) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', indent);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

void write_json_file(const std::filesystem::path& path, const rapidjson::Value& value) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("failed to create directory '" +
                                     platform::path_to_utf8(path.parent_path()) + "' - " +
                                     ec.message());
        }
    }
    std::string content = serialize_json(value, 4);
    content += "\n";
    platform::write_file_atomic(path, content);
}

}  // namespace curator::io
