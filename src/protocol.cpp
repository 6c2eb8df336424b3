#include "protocol.hpp"

#include "utils.hpp"

#include <cstring>

std::string make_delivery_ack(MediaKind kind){
    return kind == MediaKind::Video ? kVideoReceived : kImageReceived;
}

std::string make_move_mode(bool enabled){
    return enabled ? kMoveModeEnabled : kMoveModeDisabled;
}

std::string make_video_header(int64_t size){
    json j;
    j["type"] = "video";
    j["size"] = std::to_string(size);
    return j.dump();
}

std::string make_video_chunk(uint32_t sequence, const char* data, std::size_t size){
    std::string out;
    out.reserve(kVideoChunkHeaderSize + size);
    out.append(kVideoChunkMagic, sizeof(kVideoChunkMagic));
    out.push_back(static_cast<char>((sequence >> 24) & 0xff));
    out.push_back(static_cast<char>((sequence >> 16) & 0xff));
    out.push_back(static_cast<char>((sequence >> 8) & 0xff));
    out.push_back(static_cast<char>(sequence & 0xff));
    out.append(data, size);
    return out;
}

std::optional<ControlMessage> parse_control_message(const std::string& bytes){
    ControlMessage msg;
    if(bytes == kImageReceived || bytes == kVideoReceived){
        msg.type = ControlType::DeliveryAck;
        msg.ack_kind = (bytes == kVideoReceived) ? MediaKind::Video : MediaKind::Image;
        return msg;
    }
    if(bytes == kMoveModeEnabled){
        msg.type = ControlType::MoveModeOn;
        return msg;
    }
    if(bytes == kMoveModeDisabled){
        msg.type = ControlType::MoveModeOff;
        return msg;
    }
    if(bytes == kVideoComplete){
        msg.type = ControlType::VideoComplete;
        return msg;
    }
    if(bytes == kVideoError){
        msg.type = ControlType::VideoError;
        return msg;
    }
    if(bytes.size() >= kVideoChunkHeaderSize &&
       std::memcmp(bytes.data(), kVideoChunkMagic, sizeof(kVideoChunkMagic)) == 0){
        const auto* p = reinterpret_cast<const unsigned char*>(bytes.data()) + 4;
        msg.type = ControlType::VideoChunk;
        msg.sequence = (static_cast<uint32_t>(p[0]) << 24) |
                       (static_cast<uint32_t>(p[1]) << 16) |
                       (static_cast<uint32_t>(p[2]) << 8) |
                        static_cast<uint32_t>(p[3]);
        msg.payload = bytes.substr(kVideoChunkHeaderSize);
        return msg;
    }
    if(!bytes.empty() && bytes.front() == '{'){
        auto j = json::parse(bytes, nullptr, false);
        if(j.is_discarded() || !j.is_object()) return std::nullopt;
        if(j.value("type", "") != "video") return std::nullopt;
        auto size_it = j.find("size");
        if(size_it == j.end()) return std::nullopt;
        try {
            if(size_it->is_string()){
                msg.video_size = std::stoll(size_it->get<std::string>());
            } else if(size_it->is_number_integer()){
                msg.video_size = size_it->get<int64_t>();
            } else {
                return std::nullopt;
            }
        } catch(const std::exception&){
            return std::nullopt;
        }
        msg.type = ControlType::VideoHeader;
        return msg;
    }
    return std::nullopt;
}

json make_beacon(const std::string& service_type,
                 const std::string& peer_id,
                 uint16_t session_port,
                 const json& discovery_info){
    json j;
    j["type"] = "beacon";
    j["version"] = kProtocolVersion;
    j["service"] = service_type;
    j["peer_id"] = peer_id;
    j["port"] = session_port;
    j["info"] = discovery_info;
    return j;
}

json make_invite(const std::string& peer_id, const std::string& context){
    json j;
    j["type"] = "invite";
    j["peer_id"] = peer_id;
    j["context"] = context;
    return j;
}

json make_invite_response(const std::string& peer_id, bool accepted){
    json j;
    j["type"] = "invite_response";
    j["peer_id"] = peer_id;
    j["accepted"] = accepted;
    return j;
}

json make_data_message(const std::string& bytes){
    json j;
    j["type"] = "data";
    j["payload"] = base64_encode(bytes);
    return j;
}

json make_resource_begin(uint64_t id, const std::string& name, int64_t size){
    json j;
    j["type"] = "resource_begin";
    j["id"] = id;
    j["name"] = name;
    j["size"] = size;
    return j;
}

json make_resource_chunk(uint64_t id, int64_t offset, const std::string& bytes){
    json j;
    j["type"] = "resource_chunk";
    j["id"] = id;
    j["offset"] = offset;
    j["data"] = base64_encode(bytes);
    return j;
}

json make_resource_end(uint64_t id, const std::string& sha256){
    json j;
    j["type"] = "resource_end";
    j["id"] = id;
    j["sha256"] = sha256;
    return j;
}

json make_resource_cancel(uint64_t id){
    json j;
    j["type"] = "resource_cancel";
    j["id"] = id;
    return j;
}
