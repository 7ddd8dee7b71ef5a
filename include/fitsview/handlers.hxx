#pragma once

// Local headers
#include "Environment.hxx"
#include "PathResolver.hxx"
#include "Response.hxx"

namespace fitsview {
/** Serves <tt>GET /fitsview/metadata?path=...</tt>: a JSON description of
 * every HDU in a file. Throws HttpException on failure.
 */
Response handle_metadata(Environment const& env, PathResolver const& resolver);

/** Serves <tt>GET /fitsview/slice?path=...&hdu=...&slices=...[&gzip=...]</tt>:
 * the requested sub-array as raw little-endian bytes. Throws HttpException
 * on failure.
 */
Response handle_slice(Environment const& env, PathResolver const& resolver);

/// Routes a request on its method and PATH_INFO. Never throws; failures
/// become JSON error responses.
Response dispatch(Environment const& env, PathResolver const& resolver);
}  // namespace fitsview
