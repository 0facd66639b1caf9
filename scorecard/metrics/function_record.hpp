#ifndef SCORECARD_METRICS_FUNCTION_RECORD_HPP
#define SCORECARD_METRICS_FUNCTION_RECORD_HPP

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace scorecard::metrics {

// Agent Cognitive Load: complexity + logical lines / 20
inline double calculate_acl(std::size_t complexity, std::size_t logical_lines) {
    return static_cast<double>(complexity) + static_cast<double>(logical_lines) / 20.0;
}

struct FunctionRecord {
    std::string qualified_name;
    std::string file_path;
    std::size_t start_line{0};
    std::size_t end_line{0};
    std::size_t complexity{1};
    std::size_t logical_lines{0};
    double type_coverage{1.0};
    bool has_docstring{false};
    bool is_async{false};
    bool is_method{false};

    double acl() const { return calculate_acl(complexity, logical_lines); }

    // At least one parameter or the return value carries an annotation
    bool is_typed() const { return type_coverage > 0.0; }
};

struct FileSummary {
    std::string file_path;
    std::string module_name;
    std::size_t logical_lines{0};
    std::vector<FunctionRecord> functions;
    // typed functions / total functions, 1.0 when the file defines none
    double type_coverage{1.0};
    // Estimated tokens of the whole file
    std::size_t tokens{0};
    // Length of the class and function headers, see extract_signatures
    std::size_t signature_characters{0};
};

double aggregate_type_coverage(const std::vector<FunctionRecord>& functions);

} // namespace scorecard::metrics

#endif // SCORECARD_METRICS_FUNCTION_RECORD_HPP
