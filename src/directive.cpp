#include "directive.hpp"

#include <cctype>

namespace directive {

static bool isIdChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Identifier tail after the prefix: empty, or a digit followed by id chars.
// Keeps "Sea_otter" from reading as name "Sea" with identifier "er".
static bool isIdTail(std::string_view s) {
  if (s.empty()) return true;
  if (!std::isdigit(static_cast<unsigned char>(s.front()))) return false;
  for (char c : s) {
    if (!isIdChar(c)) return false;
  }
  return true;
}

std::string normalizeId(std::string_view token, const IdScheme &scheme) {
  const std::string &prefix = scheme.prefix;
  if (!prefix.empty() && token.size() > prefix.size() &&
      token.substr(0, prefix.size()) == prefix) {
    return std::string(token.substr(prefix.size()));
  }
  return std::string(token);
}

// Parse the text after '~'. offset is the position of that text in the label.
static Exclusion parseList(std::string_view list, size_t offset, const IdScheme &scheme) {
  Exclusion result;
  size_t i = 0;
  bool first = true;

  while (i < list.size()) {
    char sign = '+';
    size_t signPos = i;
    if (list[i] == '-' || list[i] == '+') {
      sign = list[i];
      ++i;
    } else if (!first) {
      throw DirectiveError(std::string("expected '+' or '-' before identifier, found '") + list[i] + "'",
                           offset + i);
    }

    size_t start = i;
    while (i < list.size() && isIdChar(list[i])) {
      ++i;
    }
    if (i == start) {
      if (i < list.size()) {
        throw DirectiveError(std::string("invalid character '") + list[i] + "' in identifier list",
                             offset + i);
      }
      throw DirectiveError("empty identifier in identifier list", offset + signPos);
    }

    std::string token = normalizeId(list.substr(start, i - start), scheme);
    if (sign == '+') {
      if (result.sourceId) {
        throw DirectiveError("more than one included identifier ('" + *result.sourceId + "' and '" +
                                 token + "')",
                             offset + signPos);
      }
      result.sourceId = std::move(token);
    } else {
      result.excludedIds.push_back(std::move(token));
    }
    first = false;
  }

  return result;
}

ParsedLabel parseLabel(std::string_view raw, const IdScheme &scheme) {
  ParsedLabel out;
  std::string_view rest = raw;

  bool graft = false;
  if (!rest.empty() && rest.back() == '@') {
    graft = true;
    rest.remove_suffix(1);
  }

  // Aliases only make sense on graft points; elsewhere '=' is ordinary label text
  std::optional<std::string> alias;
  if (graft) {
    size_t eq = rest.find('=');
    if (eq != std::string_view::npos) {
      if (eq + 1 == rest.size()) {
        throw DirectiveError("empty alias after '='", eq);
      }
      std::string_view text = rest.substr(eq + 1);
      if (size_t bad = text.find_first_of("~="); bad != std::string_view::npos) {
        throw DirectiveError(std::string("invalid character '") + text[bad] + "' in alias", eq + 1 + bad);
      }
      alias = std::string(text);
      rest = rest.substr(0, eq);
    }
  }

  size_t tilde = rest.find('~');

  std::optional<Exclusion> exclusion;
  if (tilde != std::string_view::npos) {
    exclusion = parseList(rest.substr(tilde + 1), tilde + 1, scheme);
    rest = rest.substr(0, tilde);
  }

  // Identifier: last "<sep><prefix><idchars>*" at the end of the name
  out.name = std::string(rest);
  const std::string &prefix = scheme.prefix;
  if (!prefix.empty()) {
    size_t pos = rest.rfind(prefix);
    while (pos != std::string_view::npos) {
      if (pos > 0 && (rest[pos - 1] == '_' || rest[pos - 1] == ' ') &&
          isIdTail(rest.substr(pos + prefix.size()))) {
        std::string_view id = rest.substr(pos + prefix.size());
        if (!id.empty()) {
          out.id = std::string(id);
        }
        out.name = std::string(rest.substr(0, pos - 1));
        break;
      }
      if (pos == 0) break;
      pos = rest.rfind(prefix, pos - 1);
    }
  }

  if (exclusion) out.directives.emplace_back(std::move(*exclusion));
  if (alias) out.directives.emplace_back(Alias{std::move(*alias)});
  if (graft) out.directives.emplace_back(GraftMarker{});

  return out;
}

std::string formatLabel(std::string_view name, const std::optional<std::string> &id,
                        const std::vector<Directive> &directives, const IdScheme &scheme) {
  std::string label(name);
  if (id) {
    label += '_';
    label += scheme.prefix;
    label += *id;
  }

  if (const Exclusion *ex = findExclusion(directives)) {
    label += '~';
    if (ex->sourceId) label += *ex->sourceId;
    for (const auto &excluded : ex->excludedIds) {
      label += '-';
      label += excluded;
    }
  }
  if (const Alias *alias = findAlias(directives)) {
    if (alias->label.find_first_of("~=") != std::string::npos) {
      throw DirectiveError("alias '" + alias->label + "' cannot be written back", label.size() + 1);
    }
    label += '=';
    label += alias->label;
  }
  if (hasGraftMarker(directives)) {
    label += '@';
  }
  return label;
}

bool hasGraftMarker(const std::vector<Directive> &directives) {
  for (const auto &d : directives) {
    if (std::holds_alternative<GraftMarker>(d)) return true;
  }
  return false;
}

const Exclusion *findExclusion(const std::vector<Directive> &directives) {
  for (const auto &d : directives) {
    if (const auto *ex = std::get_if<Exclusion>(&d)) return ex;
  }
  return nullptr;
}

const Alias *findAlias(const std::vector<Directive> &directives) {
  for (const auto &d : directives) {
    if (const auto *alias = std::get_if<Alias>(&d)) return alias;
  }
  return nullptr;
}

} // namespace directive
