/*
 * announcement.h
 *
 * What the operator distributes to the two peers before either connects.
 *
 * announce() takes a read-only snapshot of the session; the render_*
 * functions turn it into the banner and the copy-paste commands for each
 * advertised mode. Nothing here touches sockets.
 */

#ifndef BASHDROP_ANNOUNCEMENT_H
#define BASHDROP_ANNOUNCEMENT_H

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "mode.h"
#include "session.h"

namespace bashdrop {

struct RelayOutcome;

struct Announcement {
    std::string host;
    uint16_t port = 0;
    std::string filename;
    std::string password;
    std::vector<ModeDescriptor> modes;
};

Announcement announce(const SessionDescriptor& session);

/*
 * Shell commands for one mode. Both peers need only bash, coreutils and,
 * for the encrypted mode, openssl.
 */
std::string sender_command(const Announcement& announcement, TransferMode mode);
std::string receiver_command(const Announcement& announcement, TransferMode mode);

/*
 * Quotes a word for POSIX sh. Words made only of safe characters are
 * returned unchanged.
 */
std::string shell_quote(const std::string& word);

void render_announcement(std::ostream& out, const Announcement& announcement, bool color);
void render_listening(std::ostream& out, const Announcement& announcement, int pairing_timeout_seconds, bool color);
void render_outcome(std::ostream& out, const RelayOutcome& outcome, bool color);

}  // namespace bashdrop

#endif  // BASHDROP_ANNOUNCEMENT_H
