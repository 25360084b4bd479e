/**
* @file observability.cpp
 * @brief Counting observer plus a printf-backed variant for bring-up.
 */
#include "serlink/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace serlink::obs {

    std::string_view to_string(LinkEventKind k) noexcept {
        switch (k) {
            case LinkEventKind::FrameSent:     return "frame_sent";
            case LinkEventKind::FrameReceived: return "frame_received";
            case LinkEventKind::WordDiscarded: return "word_discarded";
            case LinkEventKind::Timeout:       return "timeout";
            case LinkEventKind::Unrouted:      return "unrouted";
            case LinkEventKind::LinkDown:      return "link_down";
            case LinkEventKind::LinkUp:        return "link_up";
        }
        return "unknown";
    }

    namespace {

    void count(Counters& c, LinkEventKind k) noexcept {
        switch (k) {
            case LinkEventKind::FrameSent:     c.frames_sent++;     break;
            case LinkEventKind::FrameReceived: c.frames_received++; break;
            case LinkEventKind::WordDiscarded: c.words_discarded++; break;
            case LinkEventKind::Timeout:       c.timeouts++;        break;
            case LinkEventKind::Unrouted:      c.unrouted_frames++; break;
            case LinkEventKind::LinkDown:      c.link_resets++;     break;
            case LinkEventKind::LinkUp:                             break;
        }
    }

    bool is_anomaly(LinkEventKind k) noexcept {
        return k == LinkEventKind::Timeout || k == LinkEventKind::Unrouted ||
               k == LinkEventKind::LinkDown || k == LinkEventKind::LinkUp;
    }

    class CountingObserver : public Observer {
    public:
        void record(const LinkEvent& e) override { count(ctr_, e.kind); }
        Counters snapshot() const override { return ctr_; }
    private:
        Counters ctr_;
    };

    class SimpleObserver : public Observer {
    public:
        void record(const LinkEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e.kind);
            if (!is_anomaly(e.kind)) return;
            const auto kind = to_string(e.kind);
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"link":"%.*s","event":"%.*s","port":%u,"length":%u,"cycle":%llu})" "\n",
              static_cast<int>(e.link.size()), e.link.data(),
              static_cast<int>(kind.size()), kind.data(),
              static_cast<unsigned>(e.port), static_cast<unsigned>(e.length),
              static_cast<unsigned long long>(e.cycle));
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    } // namespace

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

    std::unique_ptr<Observer> make_counting_observer() {
        return std::make_unique<CountingObserver>();
    }

} // namespace serlink::obs
