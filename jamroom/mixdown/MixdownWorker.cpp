#include "MixdownWorker.hpp"

#include <atomic>
#include <string>
#include <typeinfo>

#include "MixdownEngine.hpp"

namespace jamroom {

class MixdownWorker::MixdownJob : public juce::ThreadPoolJob {
  public:
    MixdownJob(AudioSourceResolver& resolver, std::string projectId, MixdownRequest request,
               CompletionCallback onComplete)
        : juce::ThreadPoolJob(MixdownWorker::getJobName(projectId)),
          resolver_(resolver),
          projectId_(std::move(projectId)),
          request_(std::move(request)),
          onComplete_(std::move(onComplete)) {}

    ~MixdownJob() override {
        // Removed from the queue before it ever ran
        if (!reported_.exchange(true)) {
            MixdownOutcome outcome;
            outcome.errorKind = MixdownError::Kind::Cancelled;
            outcome.errorMessage = "Mixdown cancelled before it started";
            report(std::move(outcome));
        }
    }

    JobStatus runJob() override {
        MixdownOutcome outcome;
        try {
            MixdownEngine engine(resolver_);
            outcome.result = engine.render(request_, [this] { return shouldExit(); });
        } catch (const MixdownError& e) {
            outcome.errorKind = e.getKind();
            outcome.errorMessage = e.what();
        } catch (const std::exception& e) {
            outcome.errorKind = MixdownError::Kind::Internal;
            outcome.errorMessage = std::string(typeid(e).name()) + ": " + e.what();
        }

        if (outcome.succeeded())
            juce::Logger::writeToLog("Mixdown of " + juce::String(projectId_) + " finished: " +
                                     juce::String(outcome.result->durationSeconds, 3) + " s, " +
                                     juce::String(outcome.result->numTracksMixed) + " tracks");
        else
            juce::Logger::writeToLog("Mixdown of " + juce::String(projectId_) + " failed (" +
                                     getMixdownErrorKindName(*outcome.errorKind) +
                                     "): " + juce::String(outcome.errorMessage));

        reported_ = true;
        report(std::move(outcome));
        return jobHasFinished;
    }

  private:
    void report(MixdownOutcome outcome) {
        if (!onComplete_)
            return;
        try {
            onComplete_(projectId_, std::move(outcome));
        } catch (const std::exception& e) {
            juce::Logger::writeToLog("Mixdown completion callback threw: " +
                                     juce::String(e.what()));
        }
    }

    AudioSourceResolver& resolver_;
    std::string projectId_;
    MixdownRequest request_;
    CompletionCallback onComplete_;
    std::atomic<bool> reported_{false};
};

namespace {

class JobNameSelector : public juce::ThreadPool::JobSelector {
  public:
    explicit JobNameSelector(juce::String name) : name_(std::move(name)) {}

    bool isJobSuitable(juce::ThreadPoolJob* job) override {
        return job->getJobName() == name_;
    }

  private:
    juce::String name_;
};

}  // namespace

MixdownWorker::MixdownWorker(AudioSourceResolver& resolver, int numThreads)
    : resolver_(resolver), pool_(juce::jmax(1, numThreads)) {}

MixdownWorker::~MixdownWorker() {
    pool_.removeAllJobs(true, 10000);
}

juce::String MixdownWorker::getJobName(const std::string& projectId) {
    return "mixdown:" + juce::String(projectId);
}

bool MixdownWorker::submit(const std::string& projectId, MixdownRequest request,
                           CompletionCallback onComplete) {
    if (isBusy(projectId))
        return false;

    pool_.addJob(new MixdownJob(resolver_, projectId, std::move(request), std::move(onComplete)),
                 true);
    return true;
}

bool MixdownWorker::cancel(const std::string& projectId, int timeoutMs) {
    JobNameSelector selector(getJobName(projectId));
    return pool_.removeAllJobs(true, timeoutMs, &selector);
}

bool MixdownWorker::isBusy(const std::string& projectId) const {
    return pool_.getNamesOfAllJobs(false).contains(getJobName(projectId));
}

}  // namespace jamroom
