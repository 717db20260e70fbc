#include "mode.h"
#include "crypto.h"

namespace bashdrop {

namespace {

const ModeDescriptor kDescriptors[] = {
    {TransferMode::PLAIN, "plain", "Plain", 0, false, ""},
    {TransferMode::INTEGRITY, "integrity", "Plain+sha256sum", crypto::HASH_HEX_SIZE, false, ""},
    {TransferMode::ENCRYPTED_INTEGRITY, "encrypted", "Encrypted+sha256sum", crypto::HASH_HEX_SIZE, true,
     "-aes-256-cbc -pbkdf2"},
};

}  // namespace

const ModeDescriptor& mode_descriptor(TransferMode mode) {
    return kDescriptors[static_cast<size_t>(mode)];
}

const std::vector<TransferMode>& all_modes() {
    static const std::vector<TransferMode> modes = {
        TransferMode::PLAIN,
        TransferMode::INTEGRITY,
        TransferMode::ENCRYPTED_INTEGRITY
    };
    return modes;
}

const char* mode_name(TransferMode mode) {
    return mode_descriptor(mode).name;
}

bool parse_mode(const std::string& name, TransferMode& out) {
    if (name == "plain") {
        out = TransferMode::PLAIN;
    } else if (name == "integrity") {
        out = TransferMode::INTEGRITY;
    } else if (name == "encrypted" || name == "encrypted-integrity") {
        out = TransferMode::ENCRYPTED_INTEGRITY;
    } else {
        return false;
    }
    return true;
}

namespace integrity {

std::vector<uint8_t> append_trailer(const std::vector<uint8_t>& file) {
    std::string digest = crypto::sha256_hex(file.data(), file.size());
    std::vector<uint8_t> stream;
    stream.reserve(file.size() + digest.size());
    stream.insert(stream.end(), file.begin(), file.end());
    stream.insert(stream.end(), digest.begin(), digest.end());
    return stream;
}

bool verify_trailer(const std::vector<uint8_t>& stream, std::vector<uint8_t>& file_out) {
    if (stream.size() < crypto::HASH_HEX_SIZE) {
        return false;
    }
    size_t file_len = stream.size() - crypto::HASH_HEX_SIZE;
    std::string expected = crypto::sha256_hex(stream.data(), file_len);

    if (!crypto::secure_compare(
            reinterpret_cast<const uint8_t*>(expected.data()),
            stream.data() + file_len,
            crypto::HASH_HEX_SIZE)) {
        return false;
    }
    file_out.assign(stream.begin(), stream.begin() + file_len);
    return true;
}

}  // namespace integrity

}  // namespace bashdrop
