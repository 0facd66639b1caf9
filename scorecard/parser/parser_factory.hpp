#ifndef SCORECARD_PARSER_FACTORY_HPP
#define SCORECARD_PARSER_FACTORY_HPP

#pragma once

#include "parser_base.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace scorecard::parser {

// Registry of language prototypes. Registration happens once at startup;
// afterwards the factory is only read, so worker threads may create parsers concurrently.
class ParserFactory {
public:
    static ParserFactory& instance() {
        static ParserFactory factory;
        return factory;
    }

    // Register a new parser type
    template<typename T>
    void register_parser() {
        auto parser = std::make_unique<T>();
        if (parser->initialize()) {
            register_parser(std::move(parser));
        }
    }

    void register_parser(std::unique_ptr<ParserBase> parser);

    // Fresh, initialized parser for a language; nullptr when unknown
    std::unique_ptr<ParserBase> create_parser(const std::string &language) const;

    // Fresh, initialized parser chosen by file extension; nullptr when unsupported
    std::unique_ptr<ParserBase> create_parser_for_file(const std::string &file_path) const;

    bool supports_file(const std::string &file_path) const;

    std::vector<std::string> get_supported_languages() const;

private:
    ParserFactory() = default;
    ParserFactory(const ParserFactory&) = delete;
    ParserFactory& operator=(const ParserFactory&) = delete;

    static std::string extension_of(const std::string &file_path);

    std::unordered_map<std::string, std::unique_ptr<ParserBase>> parsers_;
    std::unordered_map<std::string, std::string> extensions_;
};

} // namespace scorecard::parser

#endif // SCORECARD_PARSER_FACTORY_HPP
