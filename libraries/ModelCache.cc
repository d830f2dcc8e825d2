#include "ModelCache.hh"

#include <cstdio>

ModelCache::ModelCache(const ModelFitter & modelfitter)
    : fitter(modelfitter), printlvl(0)
{
}

std::shared_ptr<ModelCache::Slot> ModelCache::GetSlot(const std::string & key)
{
    std::lock_guard<std::mutex> guard(maplock);
    std::shared_ptr<Slot> & slot = slots[key];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

std::shared_ptr<const FitResult> ModelCache::GetOrFit(const std::string & key, const Eigen::MatrixXd & responses)
{
    for (;;) {
        std::shared_ptr<Slot> slot = GetSlot(key);

        std::lock_guard<std::mutex> fitguard(slot->fitlock);
        {
            std::lock_guard<std::mutex> guard(maplock);
            if (slot->entry) {
                if (printlvl > 0) printf("Model found in cache for: %s\n", key.c_str());
                return slot->entry;
            }
            // slot dropped while waiting (failed fit or Clear): start over
            auto it = slots.find(key);
            if (it == slots.end() || it->second != slot) continue;
        }

        if (printlvl > 0) printf("Model not in cache, fitting now for: %s\n", key.c_str());
        std::shared_ptr<FitResult> result;
        try {
            result = std::make_shared<FitResult>(fitter.Fit(responses));
        }
        catch (...) {
            DropSlot(key, slot);
            throw;
        }

        {
            // If the key was cleared while fitting, the slot is orphaned and the
            // result is returned without being stored.
            std::lock_guard<std::mutex> guard(maplock);
            slot->entry = result;
        }
        return result;
    }
}

void ModelCache::DropSlot(const std::string & key, const std::shared_ptr<Slot> & slot)
{
    std::lock_guard<std::mutex> guard(maplock);
    auto it = slots.find(key);
    if (it != slots.end() && it->second == slot && !slot->entry) slots.erase(it);
}

bool ModelCache::Contains(const std::string & key) const
{
    std::lock_guard<std::mutex> guard(maplock);
    auto it = slots.find(key);
    return (it != slots.end()) && it->second->entry;
}

int ModelCache::Size() const
{
    std::lock_guard<std::mutex> guard(maplock);
    int n = 0;
    for (const auto & kv : slots) {
        if (kv.second->entry) n++;
    }
    return n;
}

int ModelCache::GetNKeys() const
{
    std::lock_guard<std::mutex> guard(maplock);
    return int(slots.size());
}

void ModelCache::Clear(const std::string & key)
{
    std::lock_guard<std::mutex> guard(maplock);
    slots.erase(key);
}

void ModelCache::ClearAll()
{
    std::lock_guard<std::mutex> guard(maplock);
    slots.clear();
}
