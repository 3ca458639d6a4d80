// Copyright (c) 2025
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sntpserver {
namespace platform {

// エンドポイント情報(IPアドレスとポート)
struct Endpoint {
  // IPアドレス文字列 (例: "192.168.1.1", "2001:db8::1")。IPv4射影アドレスは
  // IPv4表記に変換される
  std::string address;
  uint16_t port;

  Endpoint() : port(0) {}
  Endpoint(const std::string& addr, uint16_t p) : address(addr), port(p) {}
};

// WaitReadable の結果
enum class WaitResult {
  kReadable,  // 受信可能データあり
  kTimeout,   // タイムアウト(シグナル割り込みを含む)
  kError,     // 致命的なエラー
};

// プラットフォーム非依存のUDPソケットインターフェース
//
// スレッド安全性: WaitReadable/Receive は受信ループのスレッドからのみ、
// Send は複数スレッドから呼ばれることがある。Send と Close の排他は呼び出し側
// (NtpServer) が行う。GetLastError は内部でロックされる。
class ISocket {
 public:
  virtual ~ISocket() = default;

  // ソケットを生成し、指定アドレス・ポートにバインド
  // address: IPv4/IPv6アドレスまたはホスト名。空文字列はデュアルスタック
  //          (IPv6未対応の環境ではIPv4)の全インターフェース、"0.0.0.0" は
  //          IPv4の全インターフェース
  // port: バインドするポート番号 (0 でエフェメラルポート)
  // 戻り値: 成功時true、失敗時false
  virtual bool Bind(const std::string& address, uint16_t port) = 0;

  // バインド済みのローカルポート番号を取得
  // 戻り値: ポート番号、未バインドまたはエラー時0
  virtual uint16_t LocalPort() const = 0;

  // 受信可能データの待機(タイムアウト付き)
  // timeout_us: タイムアウト時間(マイクロ秒)
  virtual WaitResult WaitReadable(int64_t timeout_us) = 0;

  // データグラムの受信
  // from: 送信元エンドポイント情報を格納(出力パラメータ)
  // data: 受信データを格納するバッファ(出力パラメータ)。max_size を超える
  //       データグラムは切り詰められる。長さ0のデータグラムも成功として扱う。
  // max_size: 受信する最大サイズ(バイト)
  // 戻り値: 成功時true、失敗時false
  virtual bool Receive(Endpoint* from, std::vector<uint8_t>* data,
                       size_t max_size) = 0;

  // データグラムの送信
  // to: 送信先エンドポイント情報
  // data: 送信するデータ
  // 戻り値: 成功時true、失敗時false
  virtual bool Send(const Endpoint& to, const std::vector<uint8_t>& data) = 0;

  // ソケットのクローズ
  virtual void Close() = 0;

  // 最後に発生したエラーの説明を取得
  // 戻り値: エラーメッセージ文字列
  virtual std::string GetLastError() const = 0;
};

// プラットフォーム固有のソケット実装を生成するファクトリ関数
// 戻り値: プラットフォームに応じたISocket実装のインスタンス
std::unique_ptr<ISocket> CreatePlatformSocket();

}  // namespace platform
}  // namespace sntpserver
