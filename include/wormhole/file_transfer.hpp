#ifndef WORMHOLE_FILE_TRANSFER_HPP
#define WORMHOLE_FILE_TRANSFER_HPP

#include "transit.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace Wormhole {

    // Called with the byte length of every chunk sent or received.
    using ProgressCallback = std::function<void(size_t)>;

    class FileTransfer {
    public:
        static constexpr size_t CHUNK_SIZE = 16384;

        /**
         * @brief Streams a file through an established pipe and waits for the
         * other end's acknowledgement.
         * @return The hex SHA-256 digest of the file contents.
         * @throws InvalidArgument if the file cannot be opened.
         * @throws IntegrityError if the other end reports a different digest.
         * @throws TransferIncomplete if the other end does not confirm the transfer.
         * @throws MalformedMessage if the acknowledgement cannot be parsed.
         */
        static std::string send(RecordPipe& pipe, const std::string& path, const ProgressCallback& progress = nullptr);

        /**
         * @brief Writes exactly filesize bytes from the pipe to path, then
         * acknowledges them with our digest.
         * @return The hex SHA-256 digest of the received contents.
         * @throws TransferIncomplete if the pipe ends early.
         * @throws ProtocolViolation if more than filesize bytes arrive.
         * @throws RuntimeError if the destination cannot be written.
         */
        static std::string receive(RecordPipe& pipe,
                                   const std::string& path,
                                   uint64_t filesize,
                                   const ProgressCallback& progress = nullptr);
    };

    /**
     * @brief Reduces a filename offered by the other end to a plain basename
     * that is safe to join to a local directory.
     */
    std::string safe_filename(const std::string& offered);

} // namespace Wormhole

#endif // WORMHOLE_FILE_TRANSFER_HPP
