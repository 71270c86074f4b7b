#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "flipper.pb.h"

namespace fliprpc {

using Envelope = PB::Main;

// Shell prompt, mode switch command and its acknowledgement.
constexpr const char* SHELL_PROMPT = ">: ";
constexpr const char* START_RPC_COMMAND = "start_rpc_session\r";
constexpr const char* RPC_ACCEPTED = "\n";

// Serialize an envelope (no length prefix)
std::vector<uint8_t> encode_envelope(const Envelope& envelope);

// Parse a frame payload. Throws Decode on malformed input.
Envelope decode_envelope(const std::vector<uint8_t>& payload);

// Name of the populated content field, for logs and error messages
std::string content_name(const Envelope& envelope);

// Request envelopes. command_id and has_next are assigned by the session.
Envelope ping_request(const std::vector<uint8_t>& data);
Envelope device_info_request();
Envelope protobuf_version_request();
Envelope stop_session_request();

Envelope storage_list_request(const std::string& path, bool include_md5);
Envelope storage_read_request(const std::string& path);
Envelope storage_write_request(const std::string& path,
                               const std::string& name, const uint8_t* data,
                               size_t len, const std::string& md5sum);
Envelope storage_delete_request(const std::string& path, bool recursive);
Envelope storage_mkdir_request(const std::string& path);
Envelope storage_stat_request(const std::string& path);
Envelope storage_md5sum_request(const std::string& path);
Envelope storage_rename_request(const std::string& old_path,
                                const std::string& new_path);
Envelope storage_tar_extract_request(const std::string& tar_path,
                                     const std::string& out_path);

}  // namespace fliprpc
