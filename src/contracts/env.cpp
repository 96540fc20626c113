// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/env.h>

namespace ABVM {

ContractResult Env::Call(PreparedMethod& preparedMethod)
{
    return executorContext->Call(state, preparedMethod);
}

ContractResult Env::Call(const Address& contract, const MethodFingerprint& fingerprint,
                         ExternalArgs& args, MethodContext methodContext)
{
    PreparedMethod preparedMethod;
    preparedMethod.contract = contract;
    preparedMethod.fingerprint = fingerprint;
    preparedMethod.externalArgs = args.Data();
    preparedMethod.methodContext = methodContext;
    return Call(preparedMethod);
}

} // namespace ABVM
