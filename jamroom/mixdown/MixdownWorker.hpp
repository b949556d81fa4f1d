#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <string>

#include "AudioSourceResolver.hpp"
#include "MixdownTypes.hpp"

namespace jamroom {

/**
 * @brief Runs mixdowns off the interactive path
 *
 * One job per project at a time; jobs are named "mixdown:<projectId>" in the
 * pool. The completion callback runs on a pool thread, or on the cancelling
 * thread for a job that was still queued.
 */
class MixdownWorker {
  public:
    using CompletionCallback =
        std::function<void(const std::string& projectId, MixdownOutcome outcome)>;

    explicit MixdownWorker(AudioSourceResolver& resolver, int numThreads = 1);
    ~MixdownWorker();

    MixdownWorker(const MixdownWorker&) = delete;
    MixdownWorker& operator=(const MixdownWorker&) = delete;

    /**
     * @brief Queue a mixdown
     * @return false if a mixdown of this project is already queued or running
     */
    bool submit(const std::string& projectId, MixdownRequest request,
                CompletionCallback onComplete);

    /**
     * @brief Interrupt the project's job and wait for it to stop
     * @return true if no job of the project is left
     */
    bool cancel(const std::string& projectId, int timeoutMs = 10000);

    bool isBusy(const std::string& projectId) const;

    int getNumJobs() const {
        return pool_.getNumJobs();
    }

    static juce::String getJobName(const std::string& projectId);

  private:
    class MixdownJob;

    AudioSourceResolver& resolver_;
    juce::ThreadPool pool_;
};

}  // namespace jamroom
