#pragma once

#include <string>

// ASCII lower-case copy.
std::string to_lower(const std::string& s);

// Last component of a dotted name ("app.blog.views" -> "views").
std::string last_dotted_component(const std::string& dotted);
