#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "resource_janitor.hpp"

#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

bool pid_gone(pid_t pid) {
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

class ThrowingNotifier : public Notifier {
public:
    int calls = 0;
    void notify(const std::string&, const std::string&, Urgency) override {
        calls++;
        throw std::runtime_error("notification backend exploded");
    }
};

} // namespace

TEST_CASE("ResourceJanitor", "[janitor]") {
    TmpDir dir;
    FakeNotifier notifier;

    SECTION("AcquireCreatesPrivateFiles") {
        ResourceJanitor janitor(&notifier, dir.path);
        auto audio = janitor.acquire(ResourceKind::AudioFile);
        auto text = janitor.acquire(ResourceKind::TextFile);
        auto resp = janitor.acquire(ResourceKind::ResponseBuffer);
        REQUIRE(audio.has_value());
        REQUIRE(text.has_value());
        REQUIRE(resp.has_value());

        REQUIRE(audio->extension() == ".wav");
        REQUIRE(text->extension() == ".txt");
        REQUIRE(resp->extension() == ".json");
        REQUIRE(*audio != *resp);
        REQUIRE(fs::exists(*audio));
        REQUIRE(fs::file_size(*audio) == 0);

        struct stat st;
        REQUIRE(::stat(audio->c_str(), &st) == 0);
        REQUIRE((st.st_mode & 077) == 0);
        REQUIRE(janitor.tracked() == 3);
    }

    SECTION("ProcessKindCannotBeAcquired") {
        ResourceJanitor janitor(&notifier, dir.path);
        REQUIRE_FALSE(janitor.acquire(ResourceKind::Process).has_value());
    }

    SECTION("ReleaseRemovesFilesAndKillsProcesses") {
        ResourceJanitor janitor(&notifier, dir.path, 500ms);
        auto audio = janitor.acquire(ResourceKind::AudioFile);
        REQUIRE(audio.has_value());

        auto child = ChildProcess::spawn({"sleep", "30"});
        REQUIRE(child.has_value());
        pid_t pid = child->pid();
        auto& adopted = janitor.adopt(std::move(*child));
        REQUIRE(adopted.alive());

        janitor.release_all();
        REQUIRE(janitor.released());
        REQUIRE_FALSE(fs::exists(*audio));
        REQUIRE(adopted.reaped());
        REQUIRE(pid_gone(pid));
        REQUIRE(dir.empty());
    }

    SECTION("ReleaseTwiceIsSameAsOnce") {
        ResourceJanitor janitor(&notifier, dir.path, 500ms);
        auto audio = janitor.acquire(ResourceKind::AudioFile);
        REQUIRE(audio.has_value());
        janitor.set_exit_reason(ExitReason::Failed);

        janitor.release_all();
        janitor.release_all();

        REQUIRE_FALSE(fs::exists(*audio));
        REQUIRE(notifier.notes.size() == 1);
        REQUIRE(notifier.notes[0].title == "Error");
        REQUIRE(notifier.notes[0].urgency == Urgency::Critical);
    }

    SECTION("FileAlreadyGoneIsNotAnError") {
        ResourceJanitor janitor(&notifier, dir.path);
        auto audio = janitor.acquire(ResourceKind::AudioFile);
        REQUIRE(audio.has_value());
        fs::remove(*audio);

        janitor.release_all();
        REQUIRE(janitor.released());
    }

    SECTION("ProcessesReleasedInAcquisitionOrder") {
        // Each child records the moment it received SIGTERM
        auto log = dir.path / "order.log";
        std::string script = "trap 'echo $0 >> " + log.string() + "; exit 0' TERM; "
                             "while :; do sleep 0.05; done";

        {
            ResourceJanitor janitor(&notifier, dir.path, 2000ms);
            auto first = ChildProcess::spawn({"sh", "-c", script, "recorder"});
            auto second = ChildProcess::spawn({"sh", "-c", script, "indicator"});
            REQUIRE(first.has_value());
            REQUIRE(second.has_value());
            janitor.adopt(std::move(*first));
            janitor.adopt(std::move(*second));

            // Give both shells time to install the trap
            std::this_thread::sleep_for(300ms);
            janitor.release_all();
        }

        std::ifstream f(log);
        std::string a, b;
        f >> a >> b;
        REQUIRE(a == "recorder");
        REQUIRE(b == "indicator");
    }

    SECTION("CompletedSessionIsSilent") {
        {
            ResourceJanitor janitor(&notifier, dir.path);
            REQUIRE(janitor.acquire(ResourceKind::AudioFile).has_value());
        }
        REQUIRE(notifier.notes.empty());
        REQUIRE(dir.empty());
    }

    SECTION("CancelledSessionIsInformational") {
        ResourceJanitor janitor(&notifier, dir.path);
        janitor.set_exit_reason(ExitReason::Cancelled);
        janitor.release_all();

        REQUIRE(notifier.notes.size() == 1);
        REQUIRE(notifier.notes[0].title == "Cancelled");
        REQUIRE(notifier.notes[0].urgency == Urgency::Low);
    }

    SECTION("FailureMessageOverridesGenericText") {
        ResourceJanitor janitor(&notifier, dir.path);
        janitor.set_exit_reason(ExitReason::Failed, "Rate limit exceeded. Please try again later");
        janitor.release_all();

        REQUIRE(notifier.notes.size() == 1);
        REQUIRE(notifier.notes[0].message == "Rate limit exceeded. Please try again later");
    }

    SECTION("NotifierErrorDoesNotEscapeRelease") {
        ThrowingNotifier throwing;
        ResourceJanitor janitor(&throwing, dir.path);
        auto audio = janitor.acquire(ResourceKind::AudioFile);
        REQUIRE(audio.has_value());
        janitor.set_exit_reason(ExitReason::Failed, "Groq service temporarily unavailable");

        janitor.release_all();
        REQUIRE(throwing.calls == 1);
        REQUIRE_FALSE(fs::exists(*audio));
    }

    SECTION("DestructorReleases") {
        fs::path audio;
        {
            ResourceJanitor janitor(&notifier, dir.path);
            auto p = janitor.acquire(ResourceKind::AudioFile);
            REQUIRE(p.has_value());
            audio = *p;
        }
        REQUIRE_FALSE(fs::exists(audio));
    }

    SECTION("NoAcquireAfterRelease") {
        ResourceJanitor janitor(&notifier, dir.path);
        janitor.release_all();
        REQUIRE_FALSE(janitor.acquire(ResourceKind::AudioFile).has_value());
    }
}
