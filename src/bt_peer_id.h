#pragma once

/**
 * @file bt_peer_id.h
 * @brief Peer id generation and client identification (BEP 20)
 */

#include "bt_id20.h"
#include "bt_types.h"

#include <optional>
#include <string>

namespace btcore {

class EntropySource;

/**
 * @brief Client code and version decoded from an Azureus-style peer id
 *
 * "-BC0100-..." decodes to client_id "BC", version "0100".
 */
struct AzureusPeerId {
    std::string client_id;
    std::string version;
};

/**
 * @brief Generate a peer id in Azureus-style format (BEP 20)
 *
 * Format: -XX0000-xxxxxxxxxxxx, where the prefix is copied verbatim (at most
 * 20 bytes) and the rest is filled from `source`.
 *
 * @param source Entropy for the random part
 * @param prefix Client prefix, e.g. BT_PEER_ID_PREFIX
 */
Id20 generate_peer_id(EntropySource& source, const std::string& prefix = BT_PEER_ID_PREFIX);

/**
 * @brief generate_peer_id() drawing from the process-wide system source
 */
Id20 generate_peer_id(const std::string& prefix = BT_PEER_ID_PREFIX);

/**
 * @brief Decode an Azureus-style "-XXvvvv-" prefix
 * @return Decoded parts, or empty if the id does not follow that style
 */
std::optional<AzureusPeerId> decode_peer_id(const Id20& id);

/**
 * @brief Printable form of a peer id; non-printable bytes shown as \xNN
 */
std::string peer_id_to_string(const Id20& id);

} // namespace btcore
