/*
   Copyright 2025 The Bytewalk Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#pragma once
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>

#include <boost/noncopyable.hpp>

#include <core/serialization/plan.hpp>
#include <infra/common/log.hpp>

namespace bytewalk::ser {

//! \brief Process wide memo of compiled plans keyed by type
//! \details Plans are built outside the lock. Should two threads race on the first use of the same type both
//! build a plan, the first one inserted wins and every caller is handed that one. Failed builds are never
//! stored so the failure is reported again on every call.
//! \remarks Entries are never invalidated: type definitions can't change at runtime
class PlanCache : private boost::noncopyable {
  public:
    static PlanCache& instance();

    //! \brief Returns the cached plan for T building it on first use
    template <class T>
    outcome::result<PlanPtr<T>> get_or_build(Trail& trail) {
        const std::type_index key{typeid(T)};
        if (auto cached{find(key)}; cached) {
            return std::static_pointer_cast<const Plan<T>>(std::move(cached));
        }

        auto built{compile<T>(trail)};
        if (built.has_error()) {
            LOG_DEBUG << "Plan compilation failed" << log::Tag{"type", type_name<T>()}
                      << log::Tag{"error", built.error().message()} << log::Tag{"path", trail.path()};
            return built.error();
        }
        LOG_TRACE << "Compiled plan" << log::Tag{"type", type_name<T>()}
                  << log::Tag{"signature", built.value()->signature()};
        return std::static_pointer_cast<const Plan<T>>(insert(key, built.value(), type_name<T>()));
    }

    template <class T>
    outcome::result<PlanPtr<T>> get_or_build() {
        Trail trail;
        return get_or_build<T>(trail);
    }

    //! \brief Whether a plan for T has already been stored
    template <class T>
    [[nodiscard]] bool contains() const {
        return find(std::type_index{typeid(T)}) != nullptr;
    }

    [[nodiscard]] size_t size() const;

  private:
    PlanCache() = default;

    [[nodiscard]] std::shared_ptr<const void> find(const std::type_index& key) const;

    //! \brief Stores a plan unless one is already there for the same key
    //! \return The plan actually stored for the key
    std::shared_ptr<const void> insert(const std::type_index& key, std::shared_ptr<const void> plan,
                                       const std::string& type_name);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<const void>> plans_;
};

}  // namespace bytewalk::ser
