#include "wormhole/file_transfer.hpp"

#include <fstream>
#include <iostream>

#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"

namespace Wormhole {

namespace {

void close_quietly(RecordPipe& pipe) {
    try {
        pipe.close();
    } catch (const std::exception& e) {
        std::cerr << "Closing the transit failed: " << e.what() << std::endl;
    }
}

} // namespace

std::string FileTransfer::send(RecordPipe& pipe, const std::string& path, const ProgressCallback& progress) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw InvalidArgument("cannot read " + path);
    }

    Crypto::Sha256 hasher;
    byte_vector chunk(CHUNK_SIZE);
    while (in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        size_t count = static_cast<size_t>(in.gcount());
        if (count == 0) {
            break;
        }
        byte_vector record(chunk.begin(), chunk.begin() + count);
        hasher.update(record);
        pipe.send_record(record);
        if (progress) {
            progress(count);
        }
    }
    if (in.bad()) {
        throw RuntimeError("reading " + path + " failed");
    }
    std::string hex_digest = hasher.hex_digest();

    std::optional<byte_vector> ack_bytes = pipe.receive_record();
    close_quietly(pipe);
    if (!ack_bytes) {
        throw TransferIncomplete("the other side hung up before confirming the file");
    }

    AckRecord ack = AckRecord::decode(*ack_bytes);
    if (!ack.is_ok()) {
        throw TransferIncomplete("the other side did not confirm the file");
    }
    // The digest is only checked when the other end sends one.
    if (ack.sha256 && *ack.sha256 != hex_digest) {
        throw IntegrityError("the file got corrupted on the way");
    }
    return hex_digest;
}

std::string FileTransfer::receive(RecordPipe& pipe,
                                  const std::string& path,
                                  uint64_t filesize,
                                  const ProgressCallback& progress) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw RuntimeError("cannot write " + path);
    }

    Crypto::Sha256 hasher;
    uint64_t received = 0;
    while (received < filesize) {
        std::optional<byte_vector> record = pipe.receive_record();
        if (!record) {
            break;
        }
        if (record->size() > filesize - received) {
            close_quietly(pipe);
            throw ProtocolViolation("the other side sent more than it offered");
        }

        out.write(reinterpret_cast<const char*>(record->data()), static_cast<std::streamsize>(record->size()));
        if (!out) {
            close_quietly(pipe);
            throw RuntimeError("writing " + path + " failed");
        }
        hasher.update(*record);
        received += record->size();
        if (progress) {
            progress(record->size());
        }
    }

    out.close();
    if (received != filesize) {
        close_quietly(pipe);
        throw TransferIncomplete("download did not complete");
    }
    if (!out) {
        close_quietly(pipe);
        throw RuntimeError("writing " + path + " failed");
    }

    std::string hex_digest = hasher.hex_digest();

    AckRecord ack;
    ack.ack = "ok";
    ack.sha256 = hex_digest;
    pipe.send_record(ack.encode());
    close_quietly(pipe);

    return hex_digest;
}

std::string safe_filename(const std::string& offered) {
    std::string name = offered;
    size_t separator = name.find_last_of("/\\");
    if (separator != std::string::npos) {
        name = name.substr(separator + 1);
    }

    std::string cleaned;
    cleaned.reserve(name.size());
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) {
            continue;
        }
        cleaned += c;
    }

    size_t first = cleaned.find_first_not_of(' ');
    size_t last = cleaned.find_last_not_of(' ');
    cleaned = first == std::string::npos ? std::string() : cleaned.substr(first, last - first + 1);

    if (cleaned.empty() || cleaned == "." || cleaned == "..") {
        return "download";
    }
    return cleaned;
}

} // namespace Wormhole
