#include "xfer/transfer/buffer_sizer.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>

namespace xfer::transfer {
namespace {

std::string trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isspace(c) != 0; });
    const auto last = std::find_if_not(text.rbegin(), text.rend(),
                                       [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Result<std::uint64_t> parse_size(const std::string& spec) {
    std::string normalized = to_upper(trim(spec));
    if (normalized.empty()) {
        return Err<std::uint64_t>(ErrorKind::Configuration, "Empty size specification");
    }

    std::uint64_t multiplier = 1;
    if (ends_with(normalized, "KB")) {
        multiplier = 1024;
        normalized.resize(normalized.size() - 2);
    } else if (ends_with(normalized, "MB")) {
        multiplier = 1024 * 1024;
        normalized.resize(normalized.size() - 2);
    }

    const std::string digits = trim(normalized);
    if (digits.empty()) {
        return Err<std::uint64_t>(ErrorKind::Configuration,
                                  "Missing numeric value in size '" + spec + "'");
    }

    std::uint64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Err<std::uint64_t>(ErrorKind::Configuration,
                                      "Invalid size '" + spec + "': expected a positive integer "
                                      "optionally followed by KB or MB");
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return Err<std::uint64_t>(ErrorKind::Configuration, "Size '" + spec + "' is too large");
        }
        value = value * 10 + digit;
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return Err<std::uint64_t>(ErrorKind::Configuration, "Size '" + spec + "' is too large");
    }
    return Ok(value * multiplier);
}

Result<std::size_t> parse_chunk_size(const std::string& spec) {
    auto parsed = parse_size(spec);
    if (parsed.is_error()) {
        return parsed.forward_error<std::size_t>();
    }
    if (parsed.value() == 0) {
        return Err<std::size_t>(ErrorKind::Configuration,
                                "Write size '" + spec + "' must be greater than zero");
    }
    if (parsed.value() > std::numeric_limits<std::size_t>::max()) {
        return Err<std::size_t>(ErrorKind::Configuration, "Write size '" + spec + "' is too large");
    }
    return Ok(static_cast<std::size_t>(parsed.value()));
}

std::size_t clamp_chunk_size(std::size_t requested, std::size_t max_operation_size) {
    return std::min(requested, max_operation_size);
}

std::string format_size(double bytes) {
    static constexpr std::array<const char*, 7> units{"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

    if (bytes < 1024.0) {
        return fmt::format("{:.0f} B", bytes);
    }

    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < units.size()) {
        bytes /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", bytes, units[unit]);
}

} // namespace xfer::transfer
