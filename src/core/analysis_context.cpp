#include "rlmkit/core/analysis_context.h"
#include "rlmkit/core/errors.h"
#include "rlmkit/core/text_util.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

namespace rlmkit::core {

using json = nlohmann::json;

AnalysisContext::AnalysisContext(ContextKind kind, std::string text, json structured)
    : kind_(kind), text_(std::move(text)), structured_(std::move(structured)) {
}

AnalysisContext AnalysisContext::FromText(std::string text) {
    return AnalysisContext(ContextKind::Text, std::move(text), json());
}

AnalysisContext AnalysisContext::FromJson(json value) {
    if (value.is_null()) {
        throw ConfigError("context cannot be null");
    }
    if (value.is_string()) {
        // A bare JSON string is text, not a structured payload
        return FromText(value.get<std::string>());
    }
    if (value.is_object()) {
        return AnalysisContext(ContextKind::Record, std::string(), std::move(value));
    }
    if (value.is_array()) {
        return AnalysisContext(ContextKind::Sequence, std::string(), std::move(value));
    }
    throw ConfigError(std::string("context must be text, an object or an array (got ") +
                      value.type_name() + ")");
}

AnalysisContext AnalysisContext::LoadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigError("cannot open context file: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (std::filesystem::path(path).extension() == ".json") {
        try {
            auto context = FromJson(json::parse(content));
            spdlog::info("Loaded {} context from {} ({} top-level items)",
                ContextKindToString(context.GetKind()), path, context.Size());
            return context;
        } catch (const json::exception& e) {
            throw ConfigError("context file " + path + " is not valid JSON: " + e.what());
        }
    }

    spdlog::info("Loaded text context from {} ({} bytes)", path, content.size());
    return FromText(std::move(content));
}

const std::string& AnalysisContext::GetText() const {
    if (kind_ != ContextKind::Text) {
        throw std::logic_error("GetText() called on a structured context");
    }
    return text_;
}

const json& AnalysisContext::GetStructured() const {
    if (kind_ == ContextKind::Text) {
        throw std::logic_error("GetStructured() called on a text context");
    }
    return structured_;
}

size_t AnalysisContext::Size() const {
    return kind_ == ContextKind::Text ? CountCharacters(text_) : structured_.size();
}

const char* ContextKindToString(ContextKind kind) {
    switch (kind) {
        case ContextKind::Text: return "text";
        case ContextKind::Record: return "record";
        case ContextKind::Sequence: return "sequence";
    }
    return "unknown";
}

} // namespace rlmkit::core
