#include "host_verifier.hpp"
#include <core/log.hpp>
#include <future>
#include <memory>
#include <thread>

HostIdentityVerifier::HostIdentityVerifier(KeyValueStore& trust_store, Prompter& prompter,
                                           int prompt_timeout_ms)
    : store_(trust_store), prompter_(prompter), prompt_timeout_ms_(prompt_timeout_ms) {}

std::string HostIdentityVerifier::store_key(const std::string& address, int port) {
    return fmt::format("{}:{}", address, port);
}

std::optional<std::string> HostIdentityVerifier::trusted(const std::string& address, int port) {
    return store_.get(store_key(address, port));
}

Result<void> HostIdentityVerifier::forget(const std::string& address, int port) {
    auto r = store_.remove(store_key(address, port));
    if (r.is_err()) return r;
    return store_.remove("rejected:" + store_key(address, port));
}

HostKeyCheck HostIdentityVerifier::as_check() {
    return [this](const PresentedHostKey& key) { return verify(key); };
}

// Runs the prompt on its own thread so an unanswered prompt cannot hold the
// connect forever.  The thread is detached on timeout; its answer is dropped.
std::optional<HostKeyDecision> HostIdentityVerifier::ask(const HostKeyPrompt& prompt) {
    auto promise = std::make_shared<std::promise<HostKeyDecision>>();
    auto answer = promise->get_future();
    Prompter* prompter = &prompter_;

    std::thread([promise, prompter, prompt] {
        try {
            promise->set_value(prompter->confirm_host_key(prompt));
        } catch (const std::exception& e) {
            sshlite_log(fmt::format("HostVerifier: prompt failed: {}", e.what()));
            promise->set_value(HostKeyDecision::Reject);
        }
    }).detach();

    if (answer.wait_for(std::chrono::milliseconds(prompt_timeout_ms_)) != std::future_status::ready) {
        return std::nullopt;
    }
    return answer.get();
}

Result<void> HostIdentityVerifier::verify(const PresentedHostKey& key) {
    const std::string skey = store_key(key.address, key.port);
    auto stored = store_.get(skey);

    if (stored && *stored == key.fingerprint) {
        return Result<void>::Ok();
    }

    auto rejected = store_.get("rejected:" + skey);
    if (rejected && *rejected == key.fingerprint) {
        sshlite_log(fmt::format("HostVerifier: {} presented a key that was rejected earlier", skey));
        return Result<void>::Err(
            fmt::format("Host key for {} was rejected earlier ({}). Forget the host to reconsider.",
                        skey, key.fingerprint),
            ErrorKind::HostVerification);
    }

    HostKeyPrompt prompt;
    prompt.address = key.address;
    prompt.port = key.port;
    prompt.algorithm = key.algorithm;
    prompt.presented = key.fingerprint;
    prompt.stored = stored;

    auto decision = ask(prompt);
    if (!decision) {
        return Result<void>::Err(fmt::format("Host key confirmation for {} timed out", skey),
                                 ErrorKind::HostVerification);
    }

    if (!stored) {
        // First sight: any accept trusts the key
        if (*decision == HostKeyDecision::Reject) {
            return Result<void>::Err(fmt::format("Host key for {} was not trusted", skey),
                                     ErrorKind::HostVerification);
        }
    } else {
        // Changed key: only an explicit "accept new key" replaces it
        if (*decision != HostKeyDecision::AcceptNewKey) {
            auto r = store_.set("rejected:" + skey, key.fingerprint);
            if (r.is_err()) {
                sshlite_log(fmt::format("HostVerifier: cannot record rejection: {}", r.error));
            }
            return Result<void>::Err(
                fmt::format("HOST KEY CHANGED for {}: stored {}, presented {}. Connection refused.",
                            skey, *stored, key.fingerprint),
                ErrorKind::HostVerification);
        }
    }

    auto r = store_.set(skey, key.fingerprint);
    if (r.is_err()) {
        return Result<void>::Err("Cannot save host key: " + r.error, ErrorKind::HostVerification);
    }
    auto cleared = store_.remove("rejected:" + skey);
    if (cleared.is_err()) {
        sshlite_log(fmt::format("HostVerifier: cannot clear rejection: {}", cleared.error));
    }
    sshlite_log(fmt::format("HostVerifier: trusted {} {} {}", skey, key.algorithm, key.fingerprint));
    return Result<void>::Ok();
}
