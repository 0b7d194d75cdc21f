#include "cli/commands/InspectCommand.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <string>

#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "core/ZipArchive.hpp"

namespace idemzip {

namespace fs = std::filesystem;

Expected<void> InspectCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "inspect: expected exactly one <archive>"};
    }
    const fs::path archive = args.front();

    std::ifstream in(archive, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "inspect: cannot open " + archive.string()};
    }
    uint32_t archiveCrc = 0;
    uint64_t archiveSize = 0;
    std::string chunk(Constants::IO_BUFFER_SIZE, '\0');
    while (in.read(&chunk[0], static_cast<std::streamsize>(chunk.size())) || in.gcount() > 0) {
        const size_t got = static_cast<size_t>(in.gcount());
        archiveCrc = crc32Of(chunk.substr(0, got), archiveCrc);
        archiveSize += got;
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "inspect: error reading " + archive.string()};
    }

    std::ostream& out = *ctx.out;
    size_t count = 0;
    try {
        ZipReader reader(archive);
        ZipEntry e;
        while (reader.next(e)) {
            const char* method = e.method == 8 ? "deflate" : e.method == 0 ? "stored " : "other  ";
            out << std::oct << std::setw(7) << std::setfill('0') << e.mode << std::dec << std::setfill(' ')
                << "  " << std::setw(10) << e.content.size()
                << "  " << std::hex << std::setw(8) << std::setfill('0') << e.crc32 << std::dec << std::setfill(' ')
                << "  " << method
                << "  " << formatDosDateTime(e.dosDate, e.dosTime)
                << "  " << e.name << "\n";
            ++count;
        }
    } catch (const ExtractionError& e) {
        return Error{ErrorCode::ExtractionFailed, std::string("inspect: ") + e.what()};
    }

    out << count << " entries, " << archiveSize << " bytes, crc32 "
        << std::hex << std::setw(8) << std::setfill('0') << archiveCrc << std::dec << std::setfill(' ') << "\n";
    return {};
}

}
