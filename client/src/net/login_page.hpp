#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Minimal scanning of the identity provider's login page. Only the pieces the
// form login needs are understood: one <form> with its action and the hidden
// <input> fields inside it, and the alert markup shown on a rejected login.
namespace login_page {

struct login_form {
    std::string action; // raw attribute value, entities decoded; may be relative
    std::vector<std::pair<std::string, std::string>> hidden_fields;
};

// Finds the <form> whose id attribute equals `form_id`.
std::optional<login_form> find_login_form(const std::string& html, const std::string& form_id);

// Returns the alert text when the page carries a login error marker.
std::optional<std::string> find_login_error(const std::string& html);

std::string decode_entities(const std::string& text);

} // namespace login_page
