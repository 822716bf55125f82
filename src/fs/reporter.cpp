// ============================================================
// FileMutationReporter - 実装
// ============================================================

#include "reporter.hpp"

#include "file_io.hpp"

#include <fmt/format.h>

namespace refmt {
namespace fs {

bool FileMutationReporter::report(const std::filesystem::path& path, const std::string& original,
                                  const std::string& updated, const ReportVerbs& verbs) const {
    if (original == updated) {
        return false;
    }

    if (dry_run_) {
        out_ << fmt::format("Would {} '{}'\n", verbs.would, path.string());
    } else {
        write_file(path, updated);
        out_ << fmt::format("{} '{}'\n", verbs.done, path.string());
    }
    return true;
}

void FileMutationReporter::report_unchanged(const std::filesystem::path& path) const {
    if (!dry_run_) {
        out_ << fmt::format("No changes needed in '{}'\n", path.string());
    }
}

}  // namespace fs
}  // namespace refmt
