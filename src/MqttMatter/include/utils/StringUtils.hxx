// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MQTTMATTER_STRINGUTILS_HXX
#define MQTTMATTER_STRINGUTILS_HXX

namespace mqttMatter::utils {
    inline std::string stringFormat(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);

        va_list args_copy;
        va_copy(args_copy, args);
        const int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (len < 0) {
            va_end(args);
            return {};
        }

        std::vector<char> buf(len + 1);
        vsnprintf(buf.data(), len + 1, fmt, args);
        va_end(args);

        return {buf.data(), static_cast<size_t>(len)};
    }

    inline std::string_view trim(std::string_view value) {
        constexpr std::string_view whitespace = " \t\r\n";
        const auto first = value.find_first_not_of(whitespace);
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = value.find_last_not_of(whitespace);
        return value.substr(first, last - first + 1);
    }

    // "a, b,,c" -> {"a", "b", "c"}
    inline std::vector<std::string> splitList(std::string_view list, const char separator = ',') {
        std::vector<std::string> items;
        while (!list.empty()) {
            const auto pos = list.find(separator);
            const auto item = trim(list.substr(0, pos));
            if (!item.empty()) {
                items.emplace_back(item);
            }
            if (pos == std::string_view::npos) {
                break;
            }
            list.remove_prefix(pos + 1);
        }
        return items;
    }
}

#endif //MQTTMATTER_STRINGUTILS_HXX
