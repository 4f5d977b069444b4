#include "json_utils.hpp"

#include <cmath>
#include <fmt/core.h>

namespace arbundle {

namespace {

// ECMAScript Number::toString over fmt's shortest round-trip digits:
// fixed notation for decimal exponents -7 < e < 21, otherwise d[.ddd]e+N
std::string formatDouble(double d) {
    if (d == 0) {
        return "0";
    }

    std::string shortest = fmt::format("{}", d);
    std::string sign;
    if (shortest[0] == '-') {
        sign = "-";
        shortest.erase(0, 1);
    }

    int exponent = 0;
    auto e_pos = shortest.find_first_of("eE");
    if (e_pos != std::string::npos) {
        exponent = std::stoi(shortest.substr(e_pos + 1));
        shortest.erase(e_pos);
    }

    // digits * 10^(point - digits.size()) == |d|
    auto dot = shortest.find('.');
    int point = static_cast<int>(dot == std::string::npos ? shortest.size() : dot);
    std::string digits;
    for (char c : shortest) {
        if (c != '.') {
            digits += c;
        }
    }
    while (digits.size() > 1 && digits.front() == '0') {
        digits.erase(0, 1);
        --point;
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }

    const int k = static_cast<int>(digits.size());
    const int n = point + exponent;

    if (k <= n && n <= 21) {
        return sign + digits + std::string(static_cast<size_t>(n - k), '0');
    }
    if (0 < n && n <= 21) {
        return sign + digits.substr(0, static_cast<size_t>(n)) + "." + digits.substr(static_cast<size_t>(n));
    }
    if (-6 < n && n <= 0) {
        return sign + "0." + std::string(static_cast<size_t>(-n), '0') + digits;
    }

    int e = n - 1;
    std::string mantissa = k == 1 ? digits : digits.substr(0, 1) + "." + digits.substr(1);
    return sign + mantissa + "e" + (e < 0 ? "-" : "+") + std::to_string(e < 0 ? -e : e);
}

} // anonymous namespace

std::string JsonUtils::prettyPrint(const crow::json::rvalue& value, int indent) {
    std::string out;
    prettyPrintInto(value, indent, 0, out);
    return out;
}

std::string JsonUtils::quote(const std::string& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out += '"';
    for (unsigned char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(c));
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
    return out;
}

std::string JsonUtils::formatNumber(const crow::json::rvalue& value) {
    switch (value.nt()) {
        case crow::json::num_type::Signed_integer:
            return std::to_string(value.i());
        case crow::json::num_type::Unsigned_integer:
            return std::to_string(value.u());
        default: {
            double d = value.d();
            // JSON has no representation for these; browsers print null
            if (!std::isfinite(d)) {
                return "null";
            }
            return formatDouble(d);
        }
    }
}

void JsonUtils::prettyPrintInto(const crow::json::rvalue& value, int indent, int depth, std::string& out) {
    const std::string pad(static_cast<size_t>(indent * (depth + 1)), ' ');
    const std::string closing_pad(static_cast<size_t>(indent * depth), ' ');

    switch (value.t()) {
        case crow::json::type::Null:
            out += "null";
            break;
        case crow::json::type::True:
            out += "true";
            break;
        case crow::json::type::False:
            out += "false";
            break;
        case crow::json::type::Number:
            out += formatNumber(value);
            break;
        case crow::json::type::String:
            out += quote(extractString(value));
            break;
        case crow::json::type::List: {
            if (value.size() == 0) {
                out += "[]";
                break;
            }
            out += "[\n";
            bool first = true;
            for (const auto& child : value) {
                if (!first) {
                    out += ",\n";
                }
                first = false;
                out += pad;
                prettyPrintInto(child, indent, depth + 1, out);
            }
            out += "\n" + closing_pad + "]";
            break;
        }
        case crow::json::type::Object: {
            if (value.size() == 0) {
                out += "{}";
                break;
            }
            out += "{\n";
            bool first = true;
            for (const auto& child : value) {
                if (!first) {
                    out += ",\n";
                }
                first = false;
                out += pad + quote(child.key()) + ": ";
                prettyPrintInto(child, indent, depth + 1, out);
            }
            out += "\n" + closing_pad + "}";
            break;
        }
        default:
            out += "null";
            break;
    }
}

} // namespace arbundle
