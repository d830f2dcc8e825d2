#ifndef MODELCACHE_HH
#define MODELCACHE_HH

#include "ModelFitter.hh"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <Eigen/Dense>

// Fitted models keyed by dataset identity.
//
// At most one entry is stored per key and at most one fit runs per key:
// concurrent misses for the same key wait on the key's lock and then see
// the first fit's result. A failed fit stores nothing. There is no
// eviction; Clear() is the only way to drop an entry.
class ModelCache {
private:
    struct Slot {
        std::mutex fitlock;            // held for the duration of a fit
        std::shared_ptr<FitResult> entry;  // published once the fit succeeds
    };

    const ModelFitter & fitter;
    mutable std::mutex maplock;
    std::map<std::string, std::shared_ptr<Slot>> slots;
    int printlvl;

    std::shared_ptr<Slot> GetSlot(const std::string & key);
    void DropSlot(const std::string & key, const std::shared_ptr<Slot> & slot);

public:
    explicit ModelCache(const ModelFitter & modelfitter);

    void SetPrintLevel(int lvl) { printlvl = lvl; }

    // Stored result for key, fitting `responses` on a miss. The matrix is
    // ignored on a hit.
    std::shared_ptr<const FitResult> GetOrFit(const std::string & key, const Eigen::MatrixXd & responses);

    bool Contains(const std::string & key) const;
    int Size() const;
    // Keys tracked, counting fits in progress
    int GetNKeys() const;
    void Clear(const std::string & key);
    void ClearAll();
};

#endif // MODELCACHE_HH
