#pragma once

#include <string>
#include <string_view>

namespace fleet::util {

/*
  Redacts credential-shaped substrings:

    Bearer <x>, Authorization: <x>, --token <x>, "token": "<x>",
    gh[pousr]_<x>, github_pat_<x>

  plus any literal value registered with RegisterSecret.
*/
std::string SanitizeSecrets(std::string_view text);

// Literal values (e.g. the provider token read at startup) that must never
// appear in output. Empty or very short values are ignored.
void RegisterSecret(const std::string& secret);
void ClearRegisteredSecrets();

} // namespace fleet::util
