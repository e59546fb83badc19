/// @file table_input.cpp
/// @brief TableInput resolution

#include "store/table_input.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace rootscope::store {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

absl::StatusOr<Table> ResolveTableInput(const ArtifactStore& store, const TableInput& input) {
    return std::visit(
        Overloaded{
            [](const InlineTable& in) -> absl::StatusOr<Table> {
                return in.table;
            },
            [&store](const TableReference& in) -> absl::StatusOr<Table> {
                std::string name = ArtifactStore::ResolveArtifactNameFromReference(in.name);
                if (name.empty()) {
                    return InvalidArgumentError("Table reference has no artifact name");
                }
                if (name != in.name) {
                    ROOTSCOPE_LOG_DEBUG("Resolved reference '{}' to artifact '{}'", in.name, name);
                }
                return store.LoadTable(name, in.version);
            },
            [](const RawCsv& in) -> absl::StatusOr<Table> {
                auto table = ParseCsv(in.content);
                if (!table.ok()) {
                    return InvalidArgumentError(
                        absl::StrCat("Cannot parse CSV input: ", table.status().message()));
                }
                return table;
            },
        },
        input);
}

std::string DescribeTableInput(const TableInput& input) {
    return std::visit(
        Overloaded{
            [](const InlineTable&) -> std::string { return "inline"; },
            [](const TableReference& in) -> std::string {
                return in.version.has_value()
                           ? absl::StrCat("reference:", in.name, "@v", *in.version)
                           : absl::StrCat("reference:", in.name);
            },
            [](const RawCsv&) -> std::string { return "csv"; },
        },
        input);
}

}  // namespace rootscope::store
