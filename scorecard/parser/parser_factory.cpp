#include "parser_factory.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace scorecard::parser {

void ParserFactory::register_parser(std::unique_ptr<ParserBase> parser) {
    if (!parser) {
        spdlog::error("Attempting to register null parser");
        return;
    }

    auto language_name = parser->get_language_name();
    auto extensions = parser->get_extensions();

    parsers_[language_name] = std::move(parser);

    for (const auto& ext : extensions) {
        extensions_[ext] = language_name;
    }
    spdlog::debug("Registered {} parser ({} extensions)", language_name, extensions.size());
}

std::unique_ptr<ParserBase> ParserFactory::create_parser(const std::string &language) const {
    auto it = parsers_.find(language);
    if (it == parsers_.end()) {
        return nullptr;
    }

    auto parser = it->second->clone();
    if (!parser->initialize()) {
        spdlog::error("Failed to initialize {} parser", language);
        return nullptr;
    }
    return parser;
}

std::unique_ptr<ParserBase> ParserFactory::create_parser_for_file(const std::string& file_path) const {
    auto it = extensions_.find(extension_of(file_path));
    if (it != extensions_.end()) {
        return create_parser(it->second);
    }
    return nullptr;
}

bool ParserFactory::supports_file(const std::string &file_path) const {
    return extensions_.count(extension_of(file_path)) > 0;
}

std::vector<std::string> ParserFactory::get_supported_languages() const {
    std::vector<std::string> languages;
    languages.reserve(parsers_.size());
    for (const auto& [lang, _] : parsers_) {
        languages.push_back(lang);
    }
    std::sort(languages.begin(), languages.end());
    return languages;
}

std::string ParserFactory::extension_of(const std::string &file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return ext;
}

} // namespace scorecard::parser
