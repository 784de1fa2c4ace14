#pragma once
#include <string>
#include <vector>

namespace wacast {

struct Contact {
    std::string phone;
    std::string name; // may be empty
};

// Substitute {name} and {phone}. A missing name becomes "User"; any other
// {placeholder} is left as written.
std::string personalize(const std::string& tmpl, const Contact& contact);

// Web-layer check for user-entered templates. Empty result means valid.
std::vector<std::string> validate_template(const std::string& tmpl, size_t max_length);

} // namespace wacast
