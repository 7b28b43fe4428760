#include "adsb/rx/sync.hpp"
#include "adsb/debug.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace adsb::rx {

namespace {

std::array<float, MODES_SYNC_CHIPS> chip_energies(const float* energy, unsigned spc) {
    std::array<float, MODES_SYNC_CHIPS> ch{};
    for (std::size_t k = 0; k < MODES_SYNC_CHIPS; ++k) {
        float acc = 0.0f;
        for (unsigned s = 0; s < spc; ++s)
            acc += energy[k * spc + s];
        ch[k] = acc;
    }
    return ch;
}

// Subsampled correlation against cfg.sync_filter, normalized by window energy.
float coarse_metric(const ReceiverConfig& c, const float* energy) {
    const unsigned step = c.sync_downsample_factor;
    float corr = 0.0f;
    float total = 0.0f;
    for (std::size_t k = 0; k < c.sync_filter.size(); ++k) {
        float e = energy[k * step];
        corr += c.sync_filter[k] * e;
        total += e;
    }
    if (!(total > std::numeric_limits<float>::min()))
        return -1.0f;
    return corr / total;
}

} // namespace

float preamble_metric(const float* energy, unsigned samples_per_chip) {
    auto ch = chip_energies(energy, samples_per_chip);
    float corr = 0.0f;
    float total = 0.0f;
    for (std::size_t k = 0; k < MODES_SYNC_CHIPS; ++k) {
        corr += MODES_SYNC_SEQUENCE[k] ? ch[k] : -ch[k];
        total += ch[k];
    }
    if (!(total > std::numeric_limits<float>::min()))
        return -1.0f;
    return corr / total;
}

bool validate_preamble(const float* energy, unsigned samples_per_chip) {
    auto ch = chip_energies(energy, samples_per_chip);
    float high = 0.0f;
    std::size_t n_high = 0;
    for (std::size_t k = 0; k < MODES_SYNC_CHIPS; ++k) {
        if (MODES_SYNC_SEQUENCE[k]) {
            high += ch[k];
            ++n_high;
        }
    }
    if (n_high == 0 || !(high > 0.0f))
        return false;
    const float th = 0.5f * high / static_cast<float>(n_high);
    for (std::size_t k = 0; k < MODES_SYNC_CHIPS; ++k) {
        if (MODES_SYNC_SEQUENCE[k]) {
            if (!(ch[k] > th)) return false;
        } else {
            if (!(ch[k] < th)) return false;
        }
    }
    return true;
}

SyncResult synchronize(Workspace& ws, std::span<const std::complex<float>> z) {
    const ReceiverConfig& c = ws.cfg;
    if (z.size() > c.frame_length)
        throw std::invalid_argument("Frame of " + std::to_string(z.size()) +
                                    " samples exceeds configured frame length " +
                                    std::to_string(c.frame_length));

    const std::size_t olap = c.max_packet_length;
    const std::size_t prev = ws.sync_active;

    // Keep the tail of the previous buffer so straddling packets survive.
    if (prev > olap) {
        std::copy(ws.sync_iq.begin() + static_cast<std::ptrdiff_t>(prev - olap),
                  ws.sync_iq.begin() + static_cast<std::ptrdiff_t>(prev), ws.sync_iq.begin());
        std::copy(ws.sync_energy.begin() + static_cast<std::ptrdiff_t>(prev - olap),
                  ws.sync_energy.begin() + static_cast<std::ptrdiff_t>(prev), ws.sync_energy.begin());
    }
    std::copy(z.begin(), z.end(), ws.sync_iq.begin() + static_cast<std::ptrdiff_t>(olap));
    for (std::size_t n = 0; n < z.size(); ++n)
        ws.sync_energy[olap + n] = std::norm(z[n]);
    ws.sync_active = olap + z.size();
    ++ws.frames_processed;

    SyncResult out;
    out.packets.reserve(c.max_packets_per_frame);

    // Start positions [0, limit) are searched here; later ones are searched
    // on the next call once the full packet is buffered.
    const std::size_t limit = ws.sync_active - olap;
    const float* e = ws.sync_energy.data();
    const unsigned spc = c.samples_per_chip;
    const unsigned step = std::max(1u, c.sync_downsample_factor);
    const std::size_t skip = c.preamble_length + c.short_packet_bits * c.samples_per_symbol;

    ws.corr.resize((limit + step - 1) / step);
    for (std::size_t i = 0; i < ws.corr.size(); ++i)
        ws.corr[i] = coarse_metric(c, e + i * step);

    // Resume past a packet accepted near the end of the previous call.
    std::size_t p = std::min(ws.sync_skip, limit);
    ws.sync_skip = 0;
    std::size_t resume = 0;
    std::size_t rejected = 0;
    while (p < limit) {
        const std::size_t i = (p + step - 1) / step;
        if (i >= ws.corr.size())
            break;
        const std::size_t pc = i * step;
        if (ws.corr[i] < c.sync_threshold) {
            p = pc + step;
            continue;
        }

        // Refine to full rate over the next symbol; earliest wins ties. The
        // window may run past limit since the overlap keeps those samples.
        std::size_t lo = pc > 0 ? pc - 1 : 0;
        std::size_t hi = pc + c.samples_per_symbol + 1;
        std::size_t best = lo;
        float best_metric = -2.0f;
        for (std::size_t q = lo; q < hi; ++q) {
            float m = preamble_metric(e + q, spc);
            if (m > best_metric) {
                best_metric = m;
                best = q;
            }
        }

        // Peak belongs to the next call's search region.
        if (best >= limit)
            break;

        if (best_metric < c.sync_threshold || !validate_preamble(e + best, spc)) {
            ++rejected;
            debug::set_fail(debug::FAIL_SYNC_STRUCTURE);
            p = pc + step;
            continue;
        }
        ws.dbg_last_peak = best;
        ws.dbg_last_metric = best_metric;

        if (out.packets.size() >= c.max_packets_per_frame) {
            ++out.dropped;
            debug::set_fail(debug::FAIL_SYNC_CAPACITY);
            ADSB_DEBUGF("sync: capacity %zu reached, dropping preamble at %zu",
                        c.max_packets_per_frame, best);
        } else {
            CandidatePacket pkt;
            const float* data = e + best + c.preamble_length;
            pkt.samples.assign(data, data + c.long_packet_length);
            pkt.raw.assign(ws.sync_iq.begin() + static_cast<std::ptrdiff_t>(best),
                           ws.sync_iq.begin() + static_cast<std::ptrdiff_t>(best + olap));
            pkt.offset = static_cast<std::ptrdiff_t>(best) - static_cast<std::ptrdiff_t>(olap) -
                         static_cast<std::ptrdiff_t>(c.interpolation_delay);
            out.last_packet = pkt.raw;
            out.packets.push_back(std::move(pkt));
        }
        p = best + skip;
        resume = p;
    }
    if (resume > limit)
        ws.sync_skip = resume - limit;
    ws.dbg_rejected += rejected;

    if (rejected > 0 || !out.packets.empty())
        ADSB_DEBUGF("sync: frame %llu found %zu packets, %zu dropped, %zu rejected",
                    static_cast<unsigned long long>(ws.frames_processed), out.packets.size(),
                    out.dropped, rejected);
    return out;
}

} // namespace adsb::rx
