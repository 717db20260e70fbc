/*
 * session.cpp
 *
 * SessionDescriptor construction and defaults.
 */

#include "session.h"
#include "crypto.h"

#include <algorithm>

namespace bashdrop {

namespace {

std::vector<TransferMode> normalize_modes(const std::vector<TransferMode>& requested) {
    if (requested.empty()) {
        return all_modes();
    }
    /* Keep advertising order stable regardless of how they were requested */
    std::vector<TransferMode> modes;
    for (TransferMode mode : all_modes()) {
        if (std::find(requested.begin(), requested.end(), mode) != requested.end()) {
            modes.push_back(mode);
        }
    }
    return modes;
}

}  // namespace

SessionDescriptor::SessionDescriptor(SessionParams params)
    : host_(std::move(params.host))
    , bind_address_(params.bind_address.empty() ? protocol::DEFAULT_BIND_ADDRESS : params.bind_address)
    , port_(params.port)
    , filename_(params.filename.empty() ? protocol::DEFAULT_FILENAME : params.filename)
    , password_generated_(params.password.empty())
    , password_(params.password.empty() ? crypto::generate_password() : params.password)
    , modes_(normalize_modes(params.modes)) {
}

bool SessionDescriptor::advertises(TransferMode mode) const {
    return std::find(modes_.begin(), modes_.end(), mode) != modes_.end();
}

}  // namespace bashdrop
