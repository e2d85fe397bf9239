#include "generator/naming.hpp"

#include <cctype>

namespace rustisan::generator {

namespace {

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool is_lower(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::string capitalize(const std::string& word) {
    std::string result = word;
    if (!result.empty()) {
        result[0] = upper(result[0]);
    }
    return result;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string join(const std::vector<std::string>& words, std::string_view sep) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            result += sep;
        }
        result += words[i];
    }
    return result;
}

} // namespace

std::vector<std::string> split_words(std::string_view name) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    };

    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '_' || c == '-' || c == ' ' || c == '.') {
            flush();
            continue;
        }
        if (is_upper(c) && !current.empty()) {
            char prev = name[i - 1];
            bool next_lower = i + 1 < name.size() && is_lower(name[i + 1]);
            // "userName" and the "S" in "HTTPServer" start a new word
            if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_lower)) {
                flush();
            }
        }
        current += lower(c);
    }
    flush();
    return words;
}

std::string to_snake(std::string_view name) {
    return join(split_words(name), "_");
}

std::string to_pascal(std::string_view name) {
    std::string result;
    for (const auto& word : split_words(name)) {
        result += capitalize(word);
    }
    return result;
}

std::string to_camel(std::string_view name) {
    std::string result = to_pascal(name);
    if (!result.empty()) {
        result[0] = lower(result[0]);
    }
    return result;
}

std::string to_kebab(std::string_view name) {
    return join(split_words(name), "-");
}

std::string to_title(std::string_view name) {
    std::vector<std::string> words = split_words(name);
    for (auto& word : words) {
        word = capitalize(word);
    }
    return join(words, " ");
}

std::string pluralize(std::string_view word) {
    if (word.empty()) {
        return std::string(word);
    }
    std::string lw;
    for (char c : word) {
        lw += lower(c);
    }
    std::string w(word);

    if (ends_with(lw, "s") || ends_with(lw, "sh") || ends_with(lw, "ch") || ends_with(lw, "x") ||
        ends_with(lw, "z")) {
        return w + "es";
    }
    if (ends_with(lw, "y") && lw.size() > 1) {
        char before = lw[lw.size() - 2];
        if (before != 'a' && before != 'e' && before != 'i' && before != 'o' && before != 'u') {
            return w.substr(0, w.size() - 1) + "ies";
        }
    }
    if (ends_with(lw, "fe")) {
        return w.substr(0, w.size() - 2) + "ves";
    }
    if (ends_with(lw, "f")) {
        return w.substr(0, w.size() - 1) + "ves";
    }
    return w + "s";
}

std::string singularize(std::string_view word) {
    std::string lw;
    for (char c : word) {
        lw += lower(c);
    }
    std::string w(word);

    if (ends_with(lw, "ies") && lw.size() > 3) {
        return w.substr(0, w.size() - 3) + "y";
    }
    if (ends_with(lw, "ves") && lw.size() > 3) {
        // "leaves" -> "leaf", "knives" -> "knife"
        char before = lw[lw.size() - 4];
        return w.substr(0, w.size() - 3) + (before == 'i' ? "fe" : "f");
    }
    if (ends_with(lw, "sses") || ends_with(lw, "uses") || ends_with(lw, "shes") || ends_with(lw, "ches") ||
        ends_with(lw, "xes") || ends_with(lw, "zes")) {
        return w.substr(0, w.size() - 2);
    }
    if (ends_with(lw, "s") && !ends_with(lw, "ss") && !ends_with(lw, "us") &&
        !ends_with(lw, "is") && lw.size() > 1) {
        return w.substr(0, w.size() - 1);
    }
    return w;
}

std::string pluralize_snake(std::string_view snake) {
    auto pos = snake.rfind('_');
    if (pos == std::string_view::npos) {
        return pluralize(snake);
    }
    return std::string(snake.substr(0, pos + 1)) + pluralize(snake.substr(pos + 1));
}

bool is_valid_identifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    char first = name[0];
    if (!std::isalpha(static_cast<unsigned char>(first)) && first != '_') {
        return false;
    }
    if (name == "_") {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

bool is_valid_package_name(std::string_view name) {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

std::string strip_suffix(std::string_view name, std::string_view suffix) {
    if (name.size() > suffix.size() && ends_with(name, suffix)) {
        return std::string(name.substr(0, name.size() - suffix.size()));
    }
    return std::string(name);
}

} // namespace rustisan::generator
