#pragma once

#include "../evtx_core.hpp"
#include <string>

namespace evtx {

// 一个参与者的一个命名状态所对应的三个流
//   main     = "{participantType}-{participantKey}-{stateName}"
//   pending  = "{main}-pending"
//   metadata = "{main}-metadata"
struct StreamLayout {
    std::string main;
    std::string pending;
    std::string metadata;

    static StreamLayout forParticipant(const std::string& participant_type,
                                       const std::string& participant_key,
                                       const std::string& state_name);

    static StreamLayout forParticipant(const ParticipantContext& context, const std::string& state_name) {
        return forParticipant(context.participant_type, context.participant_key, state_name);
    }
};

} // namespace evtx
