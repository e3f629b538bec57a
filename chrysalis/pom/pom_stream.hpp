#ifndef CHRYSALIS_POM_POM_STREAM_HPP
#define CHRYSALIS_POM_POM_STREAM_HPP

#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <memory>

namespace chrysalis::pom {

// Byte stream over a POM file. Closing is explicit so a failed close can be
// reported; implementations still release the stream on destruction.
class PomStream {
public:
    PomStream() = default;
    PomStream(const PomStream&) = delete;
    PomStream& operator=(const PomStream&) = delete;
    virtual ~PomStream() = default;

    virtual std::istream &input() = 0;

    // Throws std::ios_base::failure when the stream cannot be closed
    virtual void close() = 0;
};

class FilePomStream : public PomStream {
public:
    // Throws std::ios_base::failure when the file cannot be opened
    explicit FilePomStream(const std::filesystem::path &file);

    std::istream &input() override { return stream_; }
    void close() override;

private:
    std::filesystem::path file_;
    std::ifstream stream_;
};

using PomStreamOpener = std::function<std::unique_ptr<PomStream>(const std::filesystem::path &)>;

std::unique_ptr<PomStream> open_pom_file(const std::filesystem::path &file);

} // namespace chrysalis::pom

#endif // CHRYSALIS_POM_POM_STREAM_HPP
