#pragma once
#include <string>
#include <vector>
#include "protocol/DeviceDescriptor.hpp"
#include "protocol/PacketCodec.hpp"

namespace ipscout::protocol {

/**
 * @brief Turns a decoded attribute set into a typed DeviceDescriptor.
 *
 * Kind is decided in two steps because older firmware omits the
 * identification tag:
 *  1. channel-count tag present and non-zero -> Recorder
 *  2. model name starts with a recorder family prefix -> Recorder
 *  3. otherwise Camera
 *
 * Throws Error(IncompleteAttributes) when the hardware address or IPv4
 * address is missing.
 */
DeviceDescriptor classify(const AttributeSet& attrs);

bool has_recorder_model_prefix(const std::string& model_name);

// Bytes that are not part of a well-formed UTF-8 sequence are skipped.
std::string drop_invalid_utf8(const std::vector<uint8_t>& raw);

} // namespace ipscout::protocol
