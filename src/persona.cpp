#include "persona.h"
#include "core/constants.h"
#include "utils.h"

namespace lumiere {

std::string render_system_instruction(const config::PersonaConfig& persona) {
    std::string text = persona.instruction_template;
    text = utils::replace_all(text, "{name}", persona.stylist_name);
    text = utils::replace_all(text, "{city}", persona.city);
    text = utils::replace_all(text, "{country}", persona.country);
    return utils::trim_copy(text);
}

SessionConfig make_session_config(const config::AppConfig& config, const std::string& tools_json) {
    SessionConfig session;
    session.model = config.live.model;
    session.voice_name = config.live.voice;
    session.system_instruction = render_system_instruction(config.persona);
    session.tools_json = tools_json;
    session.input_sample_rate = constants::audio::INPUT_SAMPLE_RATE;
    session.output_sample_rate = constants::audio::OUTPUT_SAMPLE_RATE;
    session.frame_size = constants::audio::CAPTURE_FRAME_SIZE;
    return session;
}

} // namespace lumiere
