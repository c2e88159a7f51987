// ==============================================================================
// rename.cpp - Переименование отчётов по sha256
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <curator/discovery.hpp>
#include <curator/output.hpp>
#include <curator/platform.hpp>
#include <curator/rename.hpp>
#include <curator/report.hpp>
#include <system_error>

namespace curator::curate {

bool is_sha256_digest(std::string_view s) {
    return s.size() == 64 && std::all_of(s.begin(), s.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

RenameCounts rename_reports(const std::filesystem::path& dir, output::Writer& writer) {
    RenameCounts counts;

    auto reports = io::discover_reports(dir, io::DiscoveryOptions{}, &writer);
    for (const auto& path : reports) {
        const std::string name = platform::path_to_utf8(path.filename());

        auto loaded = io::load_report(path);
        if (!loaded.ok) {
            writer.error("Failed to process " + name + ": " + loaded.error.message);
            ++counts.failed;
            continue;
        }

        const Value* hash = lookup(loaded.report.data, {"target", "file", "sha256"});
        const std::string* sha256 = hash != nullptr ? hash->get_string() : nullptr;
        if (sha256 == nullptr || sha256->empty()) {
            writer.warn("SHA256 not found in " + name);
            ++counts.missing_hash;
            continue;
        }
        // Имя файла строится из хэша; иное значение может увести путь из dir
        if (!is_sha256_digest(*sha256)) {
            writer.warn("Invalid SHA256 in " + name + ": '" + *sha256 + "'");
            ++counts.missing_hash;
            continue;
        }

        const std::string new_name = *sha256 + ".json";
        const auto target = path.parent_path() / platform::path_from_utf8(new_name);

        std::error_code ec;
        if (std::filesystem::exists(target, ec)) {
            writer.info("Skipped (exists): " + new_name);
            ++counts.skipped;
            continue;
        }

        std::filesystem::rename(path, target, ec);
        if (ec) {
            writer.error("Failed to rename " + name + ": " + ec.message());
            ++counts.failed;
            continue;
        }
        writer.info("Renamed: " + name + " -> " + new_name);
        ++counts.renamed;
    }

    return counts;
}

}  // namespace curator::curate
