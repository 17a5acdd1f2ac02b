#include "permsnap/snapshot_writer.hpp"

#include "permsnap/logger.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <ostream>

namespace permsnap {

nlohmann::json to_document(const Snapshot& snapshot) {
    nlohmann::json data = nlohmann::json::array();
    std::size_t id = 0;
    for (const auto& [path, entry] : snapshot) {
        data.push_back(nlohmann::json{
            {"id", id++},
            {"name", path},
            {"description", entry}
        });
    }
    return nlohmann::json{{"data", std::move(data)}};
}

void write_snapshot(const Snapshot& snapshot, std::ostream& os) {
    // Undecodable file names are replaced rather than aborting the whole snapshot.
    os << to_document(snapshot).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void write_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& destination) {
    std::ofstream out{destination, std::ios::out | std::ios::trunc};
    if (!out) {
        throw SnapshotError(fmt::format("cannot open {} for writing", destination.string()));
    }
    write_snapshot(snapshot, out);
    out.close();
    if (out.fail()) {
        throw SnapshotError(fmt::format("failed to write {}", destination.string()));
    }
    Logger::instance().info("wrote {} entries to {}", snapshot.size(), destination.string());
}

} // namespace permsnap
