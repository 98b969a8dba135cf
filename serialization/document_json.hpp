#ifndef XSTITCH_SERIALIZATION_DOCUMENT_JSON_HPP
#define XSTITCH_SERIALIZATION_DOCUMENT_JSON_HPP

#include <nlohmann/json.hpp>
#include <pattern/pattern.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace xstitch::json {

constexpr const char* DOCUMENT_FORMAT = "xstitch";
constexpr int DOCUMENT_VERSION = 1;

// What a document's data section holds
enum class DocumentKind {
    Pattern,
    ThreadUsage,
    Palettes
};

inline const char* kind_name(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Pattern: return "pattern";
        case DocumentKind::ThreadUsage: return "thread_usage";
        case DocumentKind::Palettes: return "palettes";
    }
    return "unknown";
}

inline DocumentKind parse_kind(const std::string& name) {
    if (name == "pattern") return DocumentKind::Pattern;
    if (name == "thread_usage") return DocumentKind::ThreadUsage;
    if (name == "palettes") return DocumentKind::Palettes;
    throw std::runtime_error("Unknown document kind: " + name);
}

// Header line describing the grid a document was derived from
struct GridSummary {
    std::string shape;
    int width = 0;
    int height = 0;
    std::size_t color_count = 0;              // Distinct colors actually used
    std::optional<int> resolved_layer_count;
};

inline GridSummary summarize(const Pattern& pattern) {
    return GridSummary{
        .shape = std::string(shape_name(pattern.config().shape)),
        .width = pattern.width(),
        .height = pattern.height(),
        .color_count = color_histogram(pattern).size(),
        .resolved_layer_count = pattern.resolved_layer_count()
    };
}

inline void to_json(nlohmann::json& j, const GridSummary& grid) {
    j = {
        {"shape", grid.shape},
        {"width", grid.width},
        {"height", grid.height},
        {"color_count", grid.color_count}
    };
    if (grid.resolved_layer_count) {
        j["resolved_layer_count"] = *grid.resolved_layer_count;
    }
}

inline void from_json(const nlohmann::json& j, GridSummary& grid) {
    grid.shape = j.at("shape").get<std::string>();
    grid.width = j.at("width").get<int>();
    grid.height = j.at("height").get<int>();
    grid.color_count = j.value("color_count", std::size_t{0});
    if (j.contains("resolved_layer_count")) {
        grid.resolved_layer_count = j["resolved_layer_count"].get<int>();
    } else {
        grid.resolved_layer_count.reset();
    }
}

// Every file the tool writes
struct Document {
    DocumentKind kind = DocumentKind::Pattern;
    std::string created;                  // ISO 8601, UTC
    std::string source_file;
    std::optional<GridSummary> grid;
    nlohmann::json tool_config;           // Effective settings of the run
    nlohmann::json data;
};

inline void to_json(nlohmann::json& j, const Document& doc) {
    j = {
        {"format", DOCUMENT_FORMAT},
        {"version", DOCUMENT_VERSION},
        {"kind", kind_name(doc.kind)}
    };
    if (!doc.created.empty()) j["created"] = doc.created;
    if (!doc.source_file.empty()) j["source_file"] = doc.source_file;
    if (doc.grid) j["grid"] = *doc.grid;
    if (!doc.tool_config.is_null()) j["tool_config"] = doc.tool_config;
    j["data"] = doc.data;
}

inline void from_json(const nlohmann::json& j, Document& doc) {
    if (!j.is_object() || j.value("format", "") != DOCUMENT_FORMAT) {
        throw std::runtime_error("Not an xstitch document");
    }
    int version = j.value("version", 0);
    if (version < 1 || version > DOCUMENT_VERSION) {
        throw std::runtime_error("Unsupported document version: " + std::to_string(version));
    }
    if (!j.contains("data")) {
        throw std::runtime_error("Document has no data section");
    }

    doc.kind = parse_kind(j.value("kind", ""));
    doc.created = j.value("created", "");
    doc.source_file = j.value("source_file", "");
    if (j.contains("grid")) {
        doc.grid = j["grid"].get<GridSummary>();
    } else {
        doc.grid.reset();
    }
    doc.tool_config = j.contains("tool_config") ? j["tool_config"] : nlohmann::json();
    doc.data = j["data"];
}

// Current time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

inline void write_document(const std::string& path, const Document& doc) {
    write_json_file(path, doc);
}

// Load a document and check that it holds `expected`
inline Document read_document(const std::string& path, DocumentKind expected) {
    Document doc = read_json_file(path).get<Document>();
    if (doc.kind != expected) {
        throw std::runtime_error(path + " holds " + kind_name(doc.kind) +
                                 " data, expected " + kind_name(expected));
    }
    return doc;
}

}  // namespace xstitch::json

#endif // XSTITCH_SERIALIZATION_DOCUMENT_JSON_HPP
