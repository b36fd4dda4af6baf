#include "UdpSocket.hpp"

//=============================================================================================
UdpSocket::UdpSocket()
{
}

//=============================================================================================
UdpSocket::~UdpSocket()
{
}
