#include "message_template.hpp"
#include "util.hpp"

namespace wacast {

std::string personalize(const std::string& tmpl, const Contact& contact) {
    const std::string& name = contact.name.empty() ? std::string("User") : contact.name;
    std::string out = replace_all(tmpl, "{name}", name);
    return replace_all(out, "{phone}", contact.phone);
}

std::vector<std::string> validate_template(const std::string& tmpl, size_t max_length) {
    std::vector<std::string> errors;
    if (tmpl.empty()) {
        errors.push_back("Message template is required");
        return errors;
    }
    if (trim(tmpl).empty()) {
        errors.push_back("Message template cannot be empty");
    }
    if (tmpl.size() > max_length) {
        errors.push_back("Message template is too long (max " +
                         std::to_string(max_length) + " characters)");
    }

    // Collect {...} tokens that are not one of the known placeholders
    std::string invalid;
    size_t pos = 0;
    while ((pos = tmpl.find('{', pos)) != std::string::npos) {
        size_t close = tmpl.find('}', pos + 1);
        if (close == std::string::npos) break;
        std::string token = tmpl.substr(pos, close - pos + 1);
        if (token.size() > 2 && token != "{name}" && token != "{phone}") {
            if (!invalid.empty()) invalid += ", ";
            invalid += token;
        }
        pos = close + 1;
    }
    if (!invalid.empty()) {
        errors.push_back("Invalid placeholders: " + invalid +
                         ". Valid placeholders: {name}, {phone}");
    }
    return errors;
}

} // namespace wacast
