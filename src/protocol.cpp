#include "fliprpc/protocol.hpp"

#include "fliprpc/error.hpp"

namespace fliprpc {

std::vector<uint8_t> encode_envelope(const Envelope& envelope) {
  std::vector<uint8_t> out(envelope.ByteSizeLong());
  if (!out.empty() &&
      !envelope.SerializeToArray(out.data(), static_cast<int>(out.size()))) {
    throw Error(ErrorKind::Decode,
                "failed to serialize " + content_name(envelope));
  }
  return out;
}

Envelope decode_envelope(const std::vector<uint8_t>& payload) {
  Envelope envelope;
  if (!envelope.ParseFromArray(payload.data(),
                               static_cast<int>(payload.size()))) {
    throw Error(ErrorKind::Decode, "payload of " +
                                       std::to_string(payload.size()) +
                                       " bytes is not a valid envelope");
  }
  return envelope;
}

std::string content_name(const Envelope& envelope) {
  const auto* oneof = Envelope::descriptor()->FindOneofByName("content");
  const auto* field =
      Envelope::GetReflection()->GetOneofFieldDescriptor(envelope, oneof);
  return field ? field->name() : "none";
}

Envelope ping_request(const std::vector<uint8_t>& data) {
  Envelope env;
  env.mutable_system_ping_request()->set_data(
      std::string(data.begin(), data.end()));
  return env;
}

Envelope device_info_request() {
  Envelope env;
  env.mutable_system_device_info_request();
  return env;
}

Envelope protobuf_version_request() {
  Envelope env;
  env.mutable_system_protobuf_version_request();
  return env;
}

Envelope stop_session_request() {
  Envelope env;
  env.mutable_stop_session();
  return env;
}

Envelope storage_list_request(const std::string& path, bool include_md5) {
  Envelope env;
  auto* req = env.mutable_storage_list_request();
  req->set_path(path);
  req->set_include_md5(include_md5);
  return env;
}

Envelope storage_read_request(const std::string& path) {
  Envelope env;
  env.mutable_storage_read_request()->set_path(path);
  return env;
}

Envelope storage_write_request(const std::string& path,
                               const std::string& name, const uint8_t* data,
                               size_t len, const std::string& md5sum) {
  Envelope env;
  auto* req = env.mutable_storage_write_request();
  req->set_path(path);

  auto* file = req->mutable_file();
  file->set_type(PB_Storage::File::FILE);
  file->set_name(name);
  if (len > 0) {
    file->set_data(std::string(data, data + len));
  }
  file->set_size(static_cast<uint32_t>(len));
  file->set_md5sum(md5sum);
  return env;
}

Envelope storage_delete_request(const std::string& path, bool recursive) {
  Envelope env;
  auto* req = env.mutable_storage_delete_request();
  req->set_path(path);
  req->set_recursive(recursive);
  return env;
}

Envelope storage_mkdir_request(const std::string& path) {
  Envelope env;
  env.mutable_storage_mkdir_request()->set_path(path);
  return env;
}

Envelope storage_stat_request(const std::string& path) {
  Envelope env;
  env.mutable_storage_stat_request()->set_path(path);
  return env;
}

Envelope storage_md5sum_request(const std::string& path) {
  Envelope env;
  env.mutable_storage_md5sum_request()->set_path(path);
  return env;
}

Envelope storage_rename_request(const std::string& old_path,
                                const std::string& new_path) {
  Envelope env;
  auto* req = env.mutable_storage_rename_request();
  req->set_old_path(old_path);
  req->set_new_path(new_path);
  return env;
}

Envelope storage_tar_extract_request(const std::string& tar_path,
                                     const std::string& out_path) {
  Envelope env;
  auto* req = env.mutable_storage_tar_extract_request();
  req->set_tar_path(tar_path);
  req->set_out_path(out_path);
  return env;
}

}  // namespace fliprpc
