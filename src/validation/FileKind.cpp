#include "validation/FileKind.hpp"

namespace tr::validation {

const std::vector<std::string_view>& suffixesFor(const FileKind kind) {
    static const std::vector<std::string_view> rspec = {"_spec.rb"};
    static const std::vector<std::string_view> cypress = {".cy.js", ".cy.ts", ".cy.jsx", ".cy.tsx"};

    switch (kind) {
    case FileKind::Rspec: return rspec;
    case FileKind::Cypress: return cypress;
    }
    return rspec;
}

std::string_view to_string(const FileKind kind) {
    switch (kind) {
    case FileKind::Rspec: return "RSpec";
    case FileKind::Cypress: return "Cypress";
    }
    return "unknown";
}

}
