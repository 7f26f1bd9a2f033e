// ngdef/resolver/definition_resolver.hpp - Template -> companion source go-to-definition
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ngdef/basic/position.hpp"
#include "ngdef/syntax/grammar.hpp"
#include "ngdef/vfs/file_store.hpp"

namespace ngdef::resolver
{

/// A `vm.<property>` access found under the cursor.
struct ViewModelAccess
{
  std::string property;
  /// Range of the property name inside the markup file.
  Range range;
};

/**
 * Resolves `vm.<property>` references in templates to field declarations in
 * the companion TypeScript file.
 *
 * Stages, first match wins:
 *   1. derive companion candidates from the template file name
 *   2. find the smallest markup node under the cursor, reparse it as an
 *      expression and capture the `vm.<property>` access
 *   3. read the first existing companion candidate
 *   4. find the matching public field declaration in it
 *
 * Every stage that comes up empty yields a null result; only infrastructure
 * failures throw RpcError. Files and trees live for one call only.
 */
class DefinitionResolver
{
public:
  DefinitionResolver(
    const FileStore & files, std::shared_ptr<spdlog::logger> logger,
    const syntax::Grammar & markup = syntax::Grammar::html(),
    const syntax::Grammar & expression = syntax::Grammar::javascript(),
    const syntax::Grammar & source = syntax::Grammar::typescript());

  /**
   * Resolve a definition request.
   *
   * @throws RpcError InvalidRequest for non-file URIs or an unreadable
   *         template, Internal for malformed structural queries.
   */
  [[nodiscard]] std::optional<Location> resolve(std::string_view uri, Position position) const;

  /// Stage 2 on already-loaded template text.
  [[nodiscard]] std::optional<ViewModelAccess> find_view_model_access(
    std::string_view markup_text, Position position) const;

  /// Stage 4 on already-loaded companion text.
  [[nodiscard]] std::optional<Range> find_property_definition(
    std::string_view source_text, std::string_view property) const;

private:
  const FileStore & files_;
  std::shared_ptr<spdlog::logger> logger_;
  const syntax::Grammar & markup_;
  const syntax::Grammar & expression_;
  const syntax::Grammar & source_;
};

}  // namespace ngdef::resolver
