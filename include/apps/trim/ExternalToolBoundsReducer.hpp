#pragma once
#include <string>
#include <vector>

#include "apps/trim/BoundsReducer.hpp"

namespace trim {

struct ExternalToolConfig {
    // Command line; every "{input}" element is replaced by the temp PNG path.
    // The tool must print "left top width height" on stdout.
    std::vector<std::string> argv = {
        "convert", "{input}", "-trim", "-format", "%X %Y %w %h", "info:"
    };

    // Where the temp PNG goes (empty: system temp directory).
    std::string temp_dir;

    bool verbose = false;
};

// Parse "left top width height". Signs are accepted ("+3 +4 10 12"), trailing
// whitespace is ignored, anything else fails. A zero width or height gives
// Rect::Null().
bool parseBoundsOutput(const std::string& text, types::Rect& out);

// ---------------------------------------------------------------------------
// ExternalToolBoundsReducer: writes the image to a temporary PNG and asks an
// external trim tool for the bounding box.
//
// Tools decide on their own what counts as content (ImageMagick trims
// against the border colour), so results are not guaranteed to match the
// alpha-threshold reducers.
// ---------------------------------------------------------------------------
class ExternalToolBoundsReducer : public IBoundsReducer {
public:
    explicit ExternalToolBoundsReducer(const ExternalToolConfig& cfg = {});

    Status boundingBox(const img::Image& image, types::Rect& out) override;
    const char* name() const override { return "external"; }

    Status lastStatus() const { return m_status; }

    // Command and stderr of the last failed run.
    const std::string& lastCommand() const { return m_last_command; }
    const std::string& lastStderr() const { return m_last_stderr; }

    const ExternalToolConfig& getConfig() const { return m_cfg; }

private:
    ExternalToolConfig m_cfg{};

    Status m_status = Status::OK;
    std::string m_last_command;
    std::string m_last_stderr;

    std::string buildCommand(const std::string& input_path, const std::string& stderr_path) const;
    Status fail(Status s);
};

} // namespace trim
