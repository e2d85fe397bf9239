#include "generator/template.hpp"

#include "generator/naming.hpp"

namespace rustisan::generator {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

std::string render(std::string_view text, const TemplateVars& vars) {
    std::string result;
    result.reserve(text.size() + 64);

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 2, "{{") != 0) {
            result += text[i++];
            continue;
        }

        size_t close = text.find("}}", i + 2);
        if (close == std::string_view::npos) {
            result += text.substr(i);
            break;
        }

        auto slot = trim(text.substr(i + 2, close - i - 2));
        auto it = vars.find(std::string(slot));
        if (it != vars.end()) {
            result += it->second;
        } else {
            result += text.substr(i, close + 2 - i);
        }
        i = close + 2;
    }

    return result;
}

TemplateVars name_variables(std::string_view name) {
    TemplateVars vars;
    std::string snake = to_snake(name);
    std::string plural = pluralize_snake(snake);

    vars["name"] = std::string(name);
    vars["pascal"] = to_pascal(name);
    vars["snake"] = snake;
    vars["camel"] = to_camel(name);
    vars["kebab"] = to_kebab(name);
    vars["title"] = to_title(name);
    vars["plural_snake"] = plural;
    vars["plural_pascal"] = to_pascal(plural);
    return vars;
}

void TemplateRegistry::add(Template tmpl) {
    std::string key = tmpl.name;
    templates_[key] = std::move(tmpl);
}

const Template* TemplateRegistry::find(std::string_view name) const {
    auto it = templates_.find(name);
    return it == templates_.end() ? nullptr : &it->second;
}

std::vector<std::string> TemplateRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(templates_.size());
    for (const auto& [name, _] : templates_) {
        result.push_back(name);
    }
    return result;
}

} // namespace rustisan::generator
