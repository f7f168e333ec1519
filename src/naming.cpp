#include "stanza/naming.hpp"

#include <cctype>

namespace Stanza::naming {

    std::string identity(std::string_view name) {
        return std::string{ name };
    }

    std::string camel_case(std::string_view name) {
        std::string out;
        out.reserve(name.size());
        size_t i = 0;
        while (i < name.size() && name[i] == '_') out.push_back(name[i++]);

        bool upper_next = false;
        for (; i < name.size(); i++) {
            char c = name[i];
            if (c == '_') {
                upper_next = true;
                continue;
            }
            if (upper_next) {
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
                upper_next = false;
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

} // namespace Stanza::naming
