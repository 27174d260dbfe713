/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <boost/uuid/uuid_io.hpp>
#include "../src/state/polled_category.hpp"
#include "../src/util/log_runtime.h"

using namespace pollcache;
using namespace pollcache::state;
using namespace std;

// A tracked network link. It caches its own registry index so that a
// health checker holding it can go straight back to its slot.
class Link {
public:
    Link(string alias, string endpoint)
        : alias(std::move(alias)), endpoint(std::move(endpoint)), healthy(false) {}

    optional<DefaultSlabIndex> slab_index() const { return idx_; }
    void set_slab_index(optional<DefaultSlabIndex> idx) { idx_ = idx; }

    string alias;
    string endpoint;
    bool healthy;

private:
    optional<DefaultSlabIndex> idx_;
};

static string renderLinks(const SlabRegistry<Link>& links) {
    string out;
    for (auto [idx, link] : links) {
        out += "  #" + to_string(idx.position()) + " " + link.alias + " (" + link.endpoint + ") "
             + (link.healthy ? "up" : "down") + "\n";
    }
    return out;
}

// Poll once and print what the client would receive
static PollRequest pollAndPrint(const PolledRegistry<Link>& links, const PollRequest& request) {
    auto result = links.poll(request, renderLinks);
    cout << "poll -> " << readOutcomeToString(result.outcome) << " " << result.header << "\n";
    if (result.payload) {
        cout << *result.payload;
    }
    return PollRequest::since(result.header);
}

int main() {
    LogRuntime runtime(LogRuntime::Config::fromEnv());

    cout << "=== Link monitor with conditional polling ===\n\n";

    PolledRegistry<Link> links("links", StateConfig::defaults());

    // Step 1: register links, keep their indexes for the health checker
    vector<DefaultSlabIndex> handles;
    handles.push_back(links.insert(Link("mainnet-1", "10.0.0.1:9735")));
    handles.push_back(links.insert(Link("mainnet-2", "10.0.0.2:9735")));
    handles.push_back(links.insert(Link("testnet-1", "10.0.1.1:9735")));

    // Step 2: a fresh client gets everything
    PollRequest client = pollAndPrint(links, PollRequest::fresh());

    // Step 3: nothing changed, the client gets only the header back
    client = pollAndPrint(links, client);

    // Step 4: the health checker marks links up from another thread
    thread checker([&]() {
        for (auto idx : handles) {
            links.update(idx, [](Link& l) { l.healthy = true; });
        }
    });
    checker.join();
    client = pollAndPrint(links, client);

    // Step 5: remove a link, then add one; the freed index is recycled
    auto removed = links.erase(handles[1]);
    cout << "\nremoved " << removed->alias << ", still cached: "
         << (removed->slab_index() ? "yes" : "no") << "\n";
    auto reused = links.insert(Link("mainnet-3", "10.0.0.3:9735"));
    cout << "inserted mainnet-3 at #" << reused << "\n";

    // The checker's stale handle for mainnet-2 now points at mainnet-3;
    // handles must be dropped when their element is removed
    handles[1] = reused;
    client = pollAndPrint(links, client);

    auto stats = links.stats();
    cout << "\npolls=" << stats.polls << " unchanged=" << stats.unchanged_polls
         << " mutations=" << stats.mutations << "\n";
    return 0;
}
