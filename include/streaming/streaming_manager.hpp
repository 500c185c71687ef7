// EN: Streaming Manager seam for GStream - line transport interface and its serializing decorator
// FR: Interface Streaming Manager pour GStream - transport ligne par ligne et son décorateur de sérialisation

#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace GCS {

struct LineContext {
    size_t line_number = 0;
    size_t chunk_index = 0;
    bool is_last_line_in_chunk = false;
};

// EN: Line-level transport towards the controller. Implementations report a failed
//     line by throwing an exception whose what() is a human-readable message.
// FR: Transport ligne par ligne vers le contrôleur. Les implémentations signalent un
//     échec en levant une exception dont what() est un message lisible.
class IStreamingManager {
public:
    virtual ~IStreamingManager() = default;

    // EN: Returns the controller response for the line.
    // FR: Retourne la réponse du contrôleur pour la ligne.
    virtual std::string sendLine(const std::string& line, const LineContext& context) = 0;
};

// EN: Decorator that lets only one sendLine reach the wrapped transport at a time.
//     Required when more than one chunk may be in flight on a single-command channel.
// FR: Décorateur qui ne laisse passer qu'un sendLine à la fois vers le transport.
//     Requis quand plusieurs chunks peuvent être en vol sur un canal à commande unique.
class SerializedStreamingManager : public IStreamingManager {
public:
    explicit SerializedStreamingManager(IStreamingManager& inner) : inner_(inner) {}

    std::string sendLine(const std::string& line, const LineContext& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return inner_.sendLine(line, context);
    }

private:
    IStreamingManager& inner_;
    std::mutex mutex_;
};

} // namespace GCS
