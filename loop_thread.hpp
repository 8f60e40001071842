#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class loop_thread {
  protected:
    virtual bool loop_run_once() = 0; // return true to stop
    inline virtual void loop_started() {}
    inline virtual void loop_stopped() {}

    inline void loop_spawn() {
        loop_std_thread = std::thread([&] {
            loop_started();
            while (!loop_should_stop.load()) {
                if (loop_run_once()) { loop_should_stop.store(true); }
            }

            try {
                loop_stopped();
            } catch (...) {
                loop_finished.store(true);
                throw;
            }
            loop_finished.store(true);
        });
    }
    loop_thread() = default;

    // returns true when woken because the loop is stopping
    template <typename Rep, typename Period> inline bool loop_sleep_for(std::chrono::duration<Rep, Period> const &duration) {
        std::unique_lock lock{loop_wake_mutex};
        return loop_wake.wait_for(lock, duration, [&] { return loop_should_stop.load(); });
    }

  public:
    loop_thread(loop_thread const &) = delete;
    loop_thread &operator=(loop_thread const &) = delete;

    inline virtual ~loop_thread() { loop_stop_join(); }

    inline void loop_stop() {
        {
            std::lock_guard _{loop_wake_mutex};
            loop_should_stop.store(true);
        }
        loop_wake.notify_all();
    }
    [[nodiscard]] inline bool loop_has_finished() const { return loop_finished.load(); }

    void loop_stop_join() {
        loop_stop();
        if (loop_std_thread.joinable()) { loop_std_thread.join(); }
    }

  private:
    std::atomic<bool> loop_finished = false;
    std::atomic<bool> loop_should_stop = false;
    std::mutex loop_wake_mutex;
    std::condition_variable loop_wake;
    std::thread loop_std_thread;
};
