// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <system/tx_handler.h>

#include <limits>

namespace ABVM {

namespace {

std::vector<uint8_t> TransactionSlotType()
{
    return IoTypeMetadata::Struct("TransactionSlot",
                                  {{"owner", IoTypeMetadata::Address()}, {"contract", IoTypeMetadata::Address()}});
}

std::vector<uint8_t> TxHandlerMethodMetadata(MethodKind kind, const std::string& name)
{
    MethodMetadataBuilder builder(kind, name);
    if (MethodKindIsUpdate(kind)) {
        builder.EnvRw();
    } else {
        builder.EnvRo();
    }
    return TxHandlerInputs(builder).Build();
}

const std::vector<uint8_t>& AuthorizeMetadata()
{
    static const std::vector<uint8_t> metadata = TxHandlerMethodMetadata(MethodKind::VIEW_STATELESS, "authorize");
    return metadata;
}

const std::vector<uint8_t>& ExecuteMetadata()
{
    static const std::vector<uint8_t> metadata = TxHandlerMethodMetadata(MethodKind::UPDATE_STATELESS, "execute");
    return metadata;
}

template <typename T>
bool ElementsFromBytes(const ReadOnlyBytes& bytes, const T*& elements, uint32_t& numElements)
{
    if (bytes.size % sizeof(T) != 0) {
        return false;
    }
    elements = reinterpret_cast<const T*>(bytes.data);
    numElements = bytes.size / sizeof(T);
    return true;
}

template <typename T>
bool SizeInBytes(const std::vector<T>& elements, uint32_t& numElements)
{
    if (elements.size() > std::numeric_limits<uint32_t>::max() / sizeof(T)) {
        return false;
    }
    numElements = static_cast<uint32_t>(elements.size());
    return true;
}

ContractResult CallTxHandler(Env& env, MethodContext methodContext, const Address& contract,
                             const MethodFingerprint& fingerprint, const TxHandlerArgs& txArgs)
{
    const uint32_t headerSize = sizeof(TransactionHeader);
    const uint32_t readSlotsSize = txArgs.numReadSlots * sizeof(TransactionSlot);
    const uint32_t writeSlotsSize = txArgs.numWriteSlots * sizeof(TransactionSlot);
    const uint32_t payloadSize = txArgs.numPayloadWords * sizeof(TransactionPayloadWord);
    const uint32_t sealSize = txArgs.sealSize;

    ExternalArgs args;
    args.Input(txArgs.header, &headerSize)
        .Input(txArgs.readSlots, &readSlotsSize)
        .Input(txArgs.writeSlots, &writeSlotsSize)
        .Input(txArgs.payload, &payloadSize)
        .Input(txArgs.seal, &sealSize);
    return env.Call(contract, fingerprint, args, methodContext);
}

} // namespace

MethodMetadataBuilder& TxHandlerInputs(MethodMetadataBuilder& builder)
{
    return builder
        .Input("header", IoTypeMetadata::Struct("TransactionHeader",
                                                {{"block_hash", IoTypeMetadata::ByteArray(32)},
                                                 {"gas_limit", IoTypeMetadata::U64()},
                                                 {"contract", IoTypeMetadata::Address()}}))
        .Input("read_slots", IoTypeMetadata::VariableElements(0, TransactionSlotType()))
        .Input("write_slots", IoTypeMetadata::VariableElements(0, TransactionSlotType()))
        .Input("payload", IoTypeMetadata::VariableElements(0, IoTypeMetadata::U128()))
        .Input("seal", IoTypeMetadata::VariableBytes(0));
}

std::vector<uint8_t> TxHandlerTraitMetadata()
{
    return TraitMetadataBuilder("TxHandler").Method(AuthorizeMetadata()).Method(ExecuteMetadata()).Build();
}

const MethodFingerprint& TxHandlerAuthorizeFingerprint()
{
    static const MethodFingerprint fingerprint = MethodFingerprint::FromMetadata(AuthorizeMetadata());
    return fingerprint;
}

const MethodFingerprint& TxHandlerExecuteFingerprint()
{
    static const MethodFingerprint fingerprint = MethodFingerprint::FromMetadata(ExecuteMetadata());
    return fingerprint;
}

std::vector<NativeContractMethod> TxHandlerMethods(FfiFunction authorizeFn, FfiFunction executeFn)
{
    return {NativeContractMethod::New(AuthorizeMetadata(), authorizeFn),
            NativeContractMethod::New(ExecuteMetadata(), executeFn)};
}

bool TxHandlerArgs::FromInternalArgs(InternalArgs& args)
{
    ReadOnlyBytes headerBytes = args.NextRo();
    ReadOnlyBytes readSlotsBytes = args.NextRo();
    ReadOnlyBytes writeSlotsBytes = args.NextRo();
    ReadOnlyBytes payloadBytes = args.NextRo();
    ReadOnlyBytes sealBytes = args.NextRo();

    if (headerBytes.size != sizeof(TransactionHeader)) {
        return false;
    }
    header = reinterpret_cast<const TransactionHeader*>(headerBytes.data);
    seal = sealBytes.data;
    sealSize = sealBytes.size;
    return ElementsFromBytes(readSlotsBytes, readSlots, numReadSlots) &&
           ElementsFromBytes(writeSlotsBytes, writeSlots, numWriteSlots) &&
           ElementsFromBytes(payloadBytes, payload, numPayloadWords);
}

bool TxHandlerArgsFromTransaction(const Transaction& transaction, TxHandlerArgs& args)
{
    if (!SizeInBytes(transaction.readSlots, args.numReadSlots) ||
        !SizeInBytes(transaction.writeSlots, args.numWriteSlots) ||
        !SizeInBytes(transaction.payload, args.numPayloadWords) ||
        !SizeInBytes(transaction.seal, args.sealSize)) {
        return false;
    }
    args.header = &transaction.header;
    args.readSlots = transaction.readSlots.data();
    args.writeSlots = transaction.writeSlots.data();
    args.payload = transaction.payload.data();
    args.seal = transaction.seal.data();
    return true;
}

ContractResult TxHandlerAuthorize(Env& env, const Address& contract, const TxHandlerArgs& args)
{
    return CallTxHandler(env, MethodContext::KEEP, contract, TxHandlerAuthorizeFingerprint(), args);
}

ContractResult TxHandlerExecute(Env& env, MethodContext methodContext, const Address& contract,
                                const TxHandlerArgs& args)
{
    return CallTxHandler(env, methodContext, contract, TxHandlerExecuteFingerprint(), args);
}

} // namespace ABVM
