#pragma once

#include <string_view>
#include <vector>

namespace tr::validation {

enum class FileKind { Rspec, Cypress };

[[nodiscard]] const std::vector<std::string_view>& suffixesFor(FileKind kind);
[[nodiscard]] std::string_view to_string(FileKind kind);

}
