#include "pom/pom_stream.hpp"
#include <ios>

namespace chrysalis::pom {

FilePomStream::FilePomStream(const std::filesystem::path &file) : file_(file), stream_(file, std::ios::binary) {
    if (!stream_.is_open()) {
        throw std::ios_base::failure("Unable to open " + file_.string());
    }
}

void FilePomStream::close() {
    if (!stream_.is_open()) {
        return;
    }

    // Read errors already surfaced through input(); only the close itself counts here
    stream_.clear();
    stream_.close();
    if (stream_.fail()) {
        throw std::ios_base::failure("Unable to close " + file_.string());
    }
}

std::unique_ptr<PomStream> open_pom_file(const std::filesystem::path &file) {
    return std::make_unique<FilePomStream>(file);
}

} // namespace chrysalis::pom
