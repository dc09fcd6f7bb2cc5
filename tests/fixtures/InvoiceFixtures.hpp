#pragma once

#include <string>

// 測試用 DGI 發票頁面
namespace invoice::test::fixtures
{
    inline const std::string kCufe = "FE01200002679372-1-844914-7300002025051500311570140020317481978892";

    inline const std::string kQrUrl =
        "https://dgi-fep.mef.gob.pa/Consultas/FacturasPorQR?chFE=" + kCufe + "&iAmb=1&digestValue=abc";

    inline std::string invoiceHeaderBlock()
    {
        return R"(
<div class="container">
  <div class="row">
    <div class="col-sm-4"><h5>No. 0031157014</h5></div>
    <div class="col-sm-4"><h4>FACTURA</h4></div>
    <div class="col-sm-4"><h5>15/05/2025 09:50:04</h5></div>
  </div>
)";
    }

    inline std::string cufeBlock()
    {
        return "<dl class=\"dl-horizontal\"><dt>C\xC3\x93" "DIGO \xC3\x9A" "NICO DE FACTURA ELECTR\xC3\x93" "NICA (CUFE)</dt>"
               "<dd>" + kCufe + "</dd></dl>\n";
    }

    inline std::string partiesBlock()
    {
        return R"(
  <div class="panel panel-default">
    <div class="panel-heading">EMISOR</div>
    <div class="panel-body">
      <dl>
        <dt>RUC</dt><dd>155596713-2-2015</dd>
        <dt>DV</dt><dd>59</dd>
        <dt>NOMBRE</dt><dd>Lum Corporation</dd>
        <dt>DIRECCI&Oacute;N</dt><dd>Calle 50, Ciudad de Panam&aacute;</dd>
        <dt>TEL&Eacute;FONO</dt><dd>507-2631234</dd>
      </dl>
    </div>
  </div>
  <div class="panel panel-default">
    <div class="panel-heading">RECEPTOR</div>
    <div class="panel-body">
      <dl>
        <dt>RUC</dt><dd>8-888-1234</dd>
        <dt>NOMBRE</dt><dd>Juan Perez</dd>
      </dl>
    </div>
  </div>
)";
    }

    inline std::string detailBlock(bool with_rows)
    {
        std::string rows;
        if (with_rows)
        {
            rows = R"(
          <tr>
            <td data-title="Linea">1</td>
            <td data-title="C&oacute;digo">SRV-001</td>
            <td data-title="Descripci&oacute;n">Servicio de consultor&iacute;a</td>
            <td data-title="Informaci&oacute;n de inter&eacute;s"></td>
            <td data-title="Cantidad">1.00</td>
            <td data-title="Precio">100.00</td>
            <td data-title="Descuento">0.00</td>
            <td data-title="Monto">100.00</td>
            <td data-title="Impuesto">7.00</td>
            <td data-title="Total">107.00</td>
          </tr>)";
        }
        return R"(
  <div class="panel panel-default">
    <div class="panel-heading">DETALLE</div>
    <div class="panel-body collapse in">
      <table class="table">
        <thead><tr><th>Linea</th><th>C&oacute;digo</th><th>Descripci&oacute;n</th><th>Total</th></tr></thead>
        <tbody>)" + rows + R"(
        </tbody>
      </table>
    </div>
  </div>
)";
    }

    inline std::string totalsBlock(bool with_total)
    {
        std::string total_row = with_total ? R"(<tr><td class="text-right">Valor Total: <div>B/. 107.00</div></td></tr>)" : "";
        return R"(
  <table class="table">
    <tfoot>
      )" + total_row + R"(
      <tr><td class="text-right">ITBMS Total: <div>7.00</div></td></tr>
      <tr><td class="text-right">Efectivo: <div>110.00</div></td></tr>
      <tr><td class="text-right">Vuelto: <div>3.00</div></td></tr>
      <tr><td class="text-right">Total Pagado: <div>110.00</div></td></tr>
    </tfoot>
  </table>
)";
    }

    inline std::string wrap(const std::string &body)
    {
        return "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>Consulta de Facturas</title>"
               "<script>var error = 'no se pudo procesar';</script></head><body>" +
               body + "</div></body></html>";
    }

    // 一行明細、合計 107.00 / ITBMS 7.00 的完整發票
    inline std::string validInvoiceHtml()
    {
        return wrap(invoiceHeaderBlock() + cufeBlock() + partiesBlock() + detailBlock(true) + totalsBlock(true));
    }

    inline std::string invoiceWithoutTotalHtml()
    {
        return wrap(invoiceHeaderBlock() + cufeBlock() + partiesBlock() + detailBlock(true) + totalsBlock(false));
    }

    inline std::string invoiceWithoutRowsHtml()
    {
        return wrap(invoiceHeaderBlock() + cufeBlock() + partiesBlock() + detailBlock(false) + totalsBlock(true));
    }

    // 頁面沒有 CUFE 區塊，只能從 URL 的 chFE 取得
    inline std::string invoiceWithoutCufeBlockHtml()
    {
        return wrap(invoiceHeaderBlock() + partiesBlock() + detailBlock(true) + totalsBlock(true));
    }

    inline std::string portalErrorHtml()
    {
        return R"(<!DOCTYPE html><html><body>
<div class="container"><h3>Consulta de Factura Electr&oacute;nica</h3>
<div class="alert alert-danger">El documento consultado no se encuentra registrado.</div></div>
</body></html>)";
    }

    inline std::string unrelatedPageHtml()
    {
        return R"(<!DOCTYPE html><html><body><h1>Consulta de factura</h1><p>Ingrese el CUFE para continuar.</p></body></html>)";
    }

} // namespace invoice::test::fixtures
