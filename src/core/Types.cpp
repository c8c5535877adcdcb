#include "chunknet/Types.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace chunknet {

ContentName split_content_name(std::string_view content_name) {
    const std::filesystem::path path{std::string(content_name)};
    ContentName result{};
    result.base = path.stem().string();
    result.extension = path.extension().string();
    return result;
}

std::string make_chunk_name(std::string_view base, std::uint64_t ordinal, std::string_view extension) {
    std::string name;
    name.reserve(base.size() + extension.size() + 8);
    name.append(base);
    name.push_back('_');
    name.append(std::to_string(ordinal));
    name.append(extension);
    return name;
}

std::optional<std::uint64_t> chunk_ordinal(std::string_view chunk_name,
                                           std::string_view base,
                                           std::string_view extension) {
    if (chunk_name.size() <= base.size() + 1 || !chunk_name.starts_with(base)) {
        return std::nullopt;
    }
    auto rest = chunk_name.substr(base.size());
    if (rest.front() != '_') {
        return std::nullopt;
    }
    rest.remove_prefix(1);

    std::size_t digits = 0;
    while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }

    const auto suffix = rest.substr(digits);
    if (!suffix.empty() && suffix != extension) {
        return std::nullopt;
    }

    std::uint64_t ordinal = 0;
    const auto parsed = std::from_chars(rest.data(), rest.data() + digits, ordinal);
    if (parsed.ec != std::errc{}) {
        return std::nullopt;
    }
    return ordinal;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        out.push_back(kDigits[(byte >> 4) & 0x0Fu]);
        out.push_back(kDigits[byte & 0x0Fu]);
    }
    return out;
}

std::string format_local_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace chunknet
