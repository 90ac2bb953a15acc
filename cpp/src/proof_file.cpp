#include "anchor/proof_file.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace anchor
{

    Result<DetachedTimestampFile> read_proof_file(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return std::unexpected(AnchorError::io("Could not open " + path + ": " + std::strerror(errno)));

        Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            return std::unexpected(AnchorError::io("Could not read " + path));

        auto proof = DetachedTimestampFile::deserialize(data);
        if (!proof)
        {
            return std::unexpected(AnchorError::malformed(
                "Invalid timestamp file " + path + ": " + proof.error().what()));
        }
        return proof;
    }

    Result<void> write_new_proof_file(const std::string &path, const DetachedTimestampFile &proof)
    {
        auto bytes = proof.serialize();
        if (!bytes)
            return std::unexpected(bytes.error());

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd < 0)
            return std::unexpected(AnchorError::io("Failed to create timestamp " + path + ": " + std::strerror(errno)));

        const uint8_t *p = bytes->data();
        std::size_t left = bytes->size();
        while (left > 0)
        {
            auto n = ::write(fd, p, left);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                auto err = std::string(std::strerror(errno));
                ::close(fd);
                return std::unexpected(AnchorError::io("Failed to write timestamp " + path + ": " + err));
            }
            p += n;
            left -= static_cast<std::size_t>(n);
        }
        if (::close(fd) != 0)
            return std::unexpected(AnchorError::io("Failed to write timestamp " + path + ": " + std::strerror(errno)));
        return {};
    }

    Result<void> replace_proof_file(const std::string &path, const DetachedTimestampFile &proof)
    {
        const std::string backup = path + ".bak";
        spdlog::debug("Renaming existing timestamp to {}", backup);

        std::error_code ec;
        if (std::filesystem::exists(backup, ec))
            return std::unexpected(AnchorError::io("Could not backup timestamp: " + backup + " already exists"));

        std::filesystem::rename(path, backup, ec);
        if (ec)
            return std::unexpected(AnchorError::io("Could not backup timestamp: " + ec.message()));

        return write_new_proof_file(path, proof);
    }

} // namespace anchor
