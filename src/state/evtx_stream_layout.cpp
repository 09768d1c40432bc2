#include "state/evtx_stream_layout.hpp"

namespace evtx {

StreamLayout StreamLayout::forParticipant(const std::string& participant_type,
                                          const std::string& participant_key,
                                          const std::string& state_name) {
    StreamLayout layout;
    layout.main = participant_type + "-" + participant_key + "-" + state_name;
    layout.pending = layout.main + "-pending";
    layout.metadata = layout.main + "-metadata";
    return layout;
}

} // namespace evtx
