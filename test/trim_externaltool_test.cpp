#include "apps/trim/ExternalToolBoundsReducer.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << "[TEST] " << (ok ? "PASS  " : "FAIL  ") << what << "\n";
    if (!ok) ++g_failures;
}

static img::Image square_image() {
    cv::Mat m(20, 20, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    cv::rectangle(m, cv::Rect(3, 4, 10, 12), cv::Scalar(0, 0, 0, 255), cv::FILLED);
    return img::Image::fromRGBA8(m);
}

static trim::ExternalToolBoundsReducer tool(std::vector<std::string> argv) {
    trim::ExternalToolConfig cfg;
    cfg.argv = std::move(argv);
    return trim::ExternalToolBoundsReducer(cfg);
}

int main() {
    // --- output parsing ---
    {
        types::Rect r;
        check(trim::parseBoundsOutput("+3 +4 10 12\n", r) && r == types::Rect(3, 4, 10, 12), "signed output");
        check(trim::parseBoundsOutput("3 4 10 12", r) && r == types::Rect(3, 4, 10, 12), "plain output");
        check(!trim::parseBoundsOutput("abc", r), "non-numeric output rejected");
        check(!trim::parseBoundsOutput("1 2 3", r), "short output rejected");
        check(!trim::parseBoundsOutput("1 2 3 4 5", r), "trailing garbage rejected");
        check(!trim::parseBoundsOutput("1 2 -3 4", r), "negative size rejected");
        check(trim::parseBoundsOutput("1 2 0 0", r) && r.isNull(), "zero size -> null");
    }

    // --- canned tools ---
    {
        auto echo = tool({"/bin/echo", "3", "4", "10", "12"});
        types::Rect box;
        check(echo.boundingBox(square_image().translated(100, 0), box) == trim::Status::OK, "echo tool ok");
        check(box == types::Rect(103, 4, 10, 12), "tool box is moved to image coordinates");

        check(echo.boundingBox(img::Image(), box) == trim::Status::OK && box.isNull(),
              "degenerate input skips the tool");
    }
    {
        auto falsy = tool({"/bin/false"});
        types::Rect box;
        check(falsy.boundingBox(square_image(), box) == trim::Status::CLI_NONZERO_EXIT, "non-zero exit reported");
        check(falsy.lastStatus() == trim::Status::CLI_NONZERO_EXIT && box.isNull(), "lastStatus + null box");
        check(!falsy.lastCommand().empty(), "failed command is kept");
    }
    {
        auto noisy = tool({"/bin/sh", "-c", "echo boom >&2; exit 3"});
        types::Rect box;
        check(noisy.boundingBox(square_image(), box) == trim::Status::CLI_NONZERO_EXIT, "exit 3 reported");
        check(noisy.lastStderr().find("boom") != std::string::npos, "stderr is captured");
    }
    {
        auto missing = tool({"/nonexistent/iconic-trim-tool", "{input}"});
        types::Rect box;
        check(missing.boundingBox(square_image(), box) == trim::Status::CLI_NONZERO_EXIT,
              "missing tool reported as failed run");
    }
    {
        auto chatty = tool({"/bin/echo", "hello"});
        types::Rect box;
        check(chatty.boundingBox(square_image(), box) == trim::Status::CLI_BAD_OUTPUT, "garbage output reported");
    }

    // --- the input file really exists and is non-empty ---
    {
        auto sees_file = tool({"/bin/sh", "-c", "test -s \"$1\" && echo 0 0 1 1", "sh", "{input}"});
        types::Rect box;
        check(sees_file.boundingBox(square_image(), box) == trim::Status::OK, "temp png handed to the tool");
        check(box == types::Rect(0, 0, 1, 1), "box from the file check parsed");
    }

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] All checks passed\n";
    return 0;
}
