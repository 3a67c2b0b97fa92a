#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Label suffix mini-language used by skeleton trees:
//
//   Name[_<prefix><id>][~<list>][=<alias>][@]
//
//   Brachiopoda_ott826261@          graft the reference subtree 826261
//   foobar_ott123~-789-111@         graft 123 minus descendants 789 and 111
//   foobar_ott123~456-789@          graft 456 minus 789, named foobar
//   Amoebozoa_ott1~-2=Amoebae@      graft 1 minus 2, attach as "Amoebae"
//   AMORPHEA@                       graft the bespoke part named AMORPHEA
//
// The tokenizer below turns the suffix into structured directives; nothing
// past the parser looks at raw label text again.
namespace directive {

// How stable taxon identifiers are embedded in labels (e.g. "_ott123")
struct IdScheme {
  std::string prefix = "ott";
};

// This node is a placeholder for an externally supplied subtree
struct GraftMarker {};

// Inclusion/exclusion list. sourceId replaces the node's own identifier as
// the subtree to fetch; excludedIds are pruned from it before attachment.
struct Exclusion {
  std::optional<std::string> sourceId;
  std::vector<std::string> excludedIds;
};

// Substitute label for the attached clade
struct Alias {
  std::string label;
};

using Directive = std::variant<GraftMarker, Exclusion, Alias>;

class DirectiveError : public std::runtime_error {
public:
  DirectiveError(const std::string &what, size_t position)
      : std::runtime_error(what), position_(position) {}

  // Offset of the offending character within the label
  size_t position() const { return position_; }

private:
  size_t position_;
};

struct ParsedLabel {
  std::string name;
  std::optional<std::string> id;
  std::vector<Directive> directives;
};

// Split a raw (already unquoted) label into name, identifier and directives.
// Throws DirectiveError on a malformed suffix.
ParsedLabel parseLabel(std::string_view raw, const IdScheme &scheme);

// Inverse of parseLabel
std::string formatLabel(std::string_view name, const std::optional<std::string> &id,
                        const std::vector<Directive> &directives, const IdScheme &scheme);

// Strip the identifier prefix from a token ("ott123" -> "123")
std::string normalizeId(std::string_view token, const IdScheme &scheme);

bool hasGraftMarker(const std::vector<Directive> &directives);
const Exclusion *findExclusion(const std::vector<Directive> &directives);
const Alias *findAlias(const std::vector<Directive> &directives);

} // namespace directive
