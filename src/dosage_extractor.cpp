#include "tpd/dosage_extractor.hpp"
#include "tpd/channel_parser.hpp"
#include <regex>

namespace tpd {

std::optional<double>
extract_dosage(const std::string &experiment_name) {
    // The number must start the remainder or follow a '_'.
    static const std::regex dosage_pattern(R"((?:^|_)(\d+(?:[.,]\d+)?)[kK]_)");

    const auto separator = experiment_name.find('_');
    if (separator == std::string::npos) { return std::nullopt; }
    const std::string remainder = experiment_name.substr(separator + 1);

    std::smatch match;
    if (!std::regex_search(remainder, match, dosage_pattern)) { return std::nullopt; }
    return parse_decimal(match[1].str());
}

} // namespace tpd
