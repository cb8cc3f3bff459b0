#pragma once
/**
 * @file fake_fetcher.h
 * @brief Data fetcher whose requests are answered by the test
 */

#include "nightfall/loader/progressive_loader.h"
#include <string>
#include <utility>
#include <vector>

namespace nightfall::test_support {

class FakeFetcher : public loader::IDataFetcher {
public:
    struct Pending {
        loader::DataRequest request;
        loader::FetchCallback callback;
    };

    void fetch(const loader::DataRequest& request, loader::FetchCallback callback) override {
        issued.push_back(request.id);
        pending.push_back(Pending{request, std::move(callback)});
    }

    /// Answer the oldest outstanding fetch for the id
    bool succeed(const std::string& id, const std::string& data) {
        return answer(id, loader::FetchResponse::success(data));
    }

    bool fail(const std::string& id, const std::string& error = "unavailable") {
        return answer(id, loader::FetchResponse::failure(error));
    }

    SizeT outstanding() const { return pending.size(); }

    std::vector<std::string> issued;
    std::vector<Pending> pending;

private:
    bool answer(const std::string& id, const loader::FetchResponse& response) {
        for (auto it = pending.begin(); it != pending.end(); ++it) {
            if (it->request.id == id) {
                loader::FetchCallback callback = std::move(it->callback);
                pending.erase(it);
                callback(response);
                return true;
            }
        }
        return false;
    }
};

} // namespace nightfall::test_support
