#include "ksau/cancellation.hpp"

#include "ksau/error_codes.hpp"

namespace ksau
{

    void CancellationToken::throw_if_cancelled() const
    {
        if (cancelled())
        {
            throw Error(ErrorCode::Aborted, "aborted by user");
        }
    }

} // namespace ksau
