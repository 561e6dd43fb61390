#include "protolayout/registry/pid.h"

#include "protolayout/core/errors.h"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace protolayout {

namespace {

std::mt19937_64& uuidEngine() {
    thread_local std::mt19937_64 engine{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }()};
    return engine;
}

bool isUuid(std::string_view text) {
    if (text.size() != 36) return false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string generateUuid4() {
    std::array<std::uint8_t, 16> u{};
    auto& engine = uuidEngine();
    for (std::size_t i = 0; i < u.size(); i += 8) {
        const std::uint64_t bits = engine();
        for (std::size_t j = 0; j < 8; ++j) u[i + j] = static_cast<std::uint8_t>(bits >> (j * 8));
    }
    u[6] = static_cast<std::uint8_t>((u[6] & 0x0F) | 0x40);
    u[8] = static_cast<std::uint8_t>((u[8] & 0x3F) | 0x80);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < u.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[u[i] >> 4]);
        out.push_back(kHex[u[i] & 0x0F]);
    }
    return out;
}

std::string issuePid(ProtoClass cls) {
    std::string pid(protoClassPrefix(cls));
    pid.push_back('_');
    pid += generateUuid4();
    return pid;
}

std::string issuePid(std::string_view prefix) {
    const auto cls = protoClassFromPrefix(prefix);
    if (!cls) throw RegistryError("unknown PID prefix '" + std::string(prefix) + "'");
    return issuePid(*cls);
}

ParsedPid parsePid(std::string_view pid) {
    const std::size_t sep = pid.find('_');
    if (sep == std::string_view::npos || sep == 0) {
        throw ParseError("malformed PID '" + std::string(pid) + "': missing prefix");
    }
    const std::string_view prefix = pid.substr(0, sep);
    const std::string_view uuid = pid.substr(sep + 1);
    if (!isUuid(uuid)) throw ParseError("malformed PID '" + std::string(pid) + "': bad uuid");
    const auto cls = protoClassFromPrefix(prefix);
    if (!cls) throw RegistryError("unknown PID prefix '" + std::string(prefix) + "'");
    return ParsedPid{*cls, std::string(prefix), std::string(uuid)};
}

bool isValidPid(std::string_view pid) noexcept {
    return pidClass(pid).has_value();
}

std::optional<ProtoClass> pidClass(std::string_view pid) noexcept {
    const std::size_t sep = pid.find('_');
    if (sep == std::string_view::npos || sep == 0) return std::nullopt;
    if (!isUuid(pid.substr(sep + 1))) return std::nullopt;
    return protoClassFromPrefix(pid.substr(0, sep));
}

} // namespace protolayout
