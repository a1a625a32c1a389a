#ifndef MOUSEPCA_PCA_PROJECTOR_HPP_
#define MOUSEPCA_PCA_PROJECTOR_HPP_

#include <frames/session.hpp>
#include <pca/errors.hpp>
#include <pca/pca_basis.hpp>
#include <pca/scores.hpp>

namespace mousepca {

// Computes per-frame PCA scores: for every valid frame the flattened pixels
// minus the basis mean, dotted with each component. Invalid frames get a
// sentinel row. Frames are flattened chunk_size at a time to bound memory.
//
// Fails with kShapeMismatch if the flattened frame size differs from the basis
// dimension. Stateless; safe to call concurrently for different sessions.
bool Project(const Session &session, const PcaBasis &basis,
             size_t chunk_size, ScoreMatrix *scores, PipelineError *error);

} // namespace mousepca

#endif // MOUSEPCA_PCA_PROJECTOR_HPP_
